#include "RangeCalculator.hpp"
#include "core/Errors.hpp"
#include <algorithm>

namespace candle {

    AxisRanges RangeCalculator::compute(const CandleSlice& slice, double bufferFraction) {
        AxisRanges ranges;
        ranges.time = timeRange(slice);
        ranges.price = priceRange(slice, bufferFraction);
        return ranges;
    }

    TimeRange RangeCalculator::timeRange(const CandleSlice& slice) {
        if (slice.empty()) {
            throw EmptyWindow("Cannot compute a time range over an empty window");
        }
        return TimeRange{ slice.front().time, slice.back().time };
    }

    PriceRange RangeCalculator::priceRange(const CandleSlice& slice, double bufferFraction) {
        if (slice.empty()) {
            throw EmptyWindow("Cannot compute a price range over an empty window");
        }

        Price minLow = slice.front().low;
        Price maxHigh = slice.front().high;
        for (const auto& c : slice) {
            minLow = std::min(minLow, c.low);
            maxHigh = std::max(maxHigh, c.high);
        }

        double buffer = bufferFraction * (maxHigh - minLow);
        return PriceRange{ minLow - buffer, maxHigh + buffer };
    }

} // namespace candle
