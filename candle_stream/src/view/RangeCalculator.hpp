#pragma once

#include "core/Types.hpp"
#include "core/CandleLog.hpp"

namespace candle {

    // Axis ranges for a visible slice. The price range is padded on both sides
    // by bufferFraction * (maxHigh - minLow).
    class RangeCalculator {
    public:
        // Throws EmptyWindow if the slice holds no candles
        static AxisRanges compute(const CandleSlice& slice, double bufferFraction);

        static TimeRange timeRange(const CandleSlice& slice);
        static PriceRange priceRange(const CandleSlice& slice, double bufferFraction);
    };

} // namespace candle
