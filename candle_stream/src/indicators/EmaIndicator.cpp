#include "EmaIndicator.hpp"

namespace candle {

    EmaIndicator::EmaIndicator(const IndicatorParams& params)
        : Indicator(IndicatorKind::EMA, params)
    {
        output(OUTPUT);
    }

    void EmaIndicator::step(const CandleLog& log, size_t index) {
        double close = log.at(index).close;

        if (!ema_) {
            ema_ = close;
        }
        else {
            *ema_ += getAlpha() * (close - *ema_);
        }

        output(OUTPUT).push_back(ema_);
    }

} // namespace candle
