#pragma once

#include "Indicator.hpp"
#include <deque>

namespace candle {

    // SMA(close) +/- multiplier * rolling mean of true range, both plain
    // unweighted means over the trailing `period` candles. Undefined until
    // `period` candles exist.
    class AtrBandsIndicator : public Indicator {
    public:
        explicit AtrBandsIndicator(const IndicatorParams& params = IndicatorParams{ 20, 2.0 });

        static constexpr const char* UPPER = "ATR_Upper";
        static constexpr const char* LOWER = "ATR_Lower";

    protected:
        void step(const CandleLog& log, size_t index) override;
        void resetState() override;

    private:
        std::deque<double> closes_;
        std::deque<double> trueRanges_;

        static double mean(const std::deque<double>& window);
    };

} // namespace candle
