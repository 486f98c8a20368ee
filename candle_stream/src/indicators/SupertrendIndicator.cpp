#include "SupertrendIndicator.hpp"

namespace candle {

    SupertrendIndicator::SupertrendIndicator(const IndicatorParams& params)
        : Indicator(IndicatorKind::SUPERTREND, params)
    {
        output(OUTPUT);
    }

    void SupertrendIndicator::resetState() {
        atr_.reset();
        previousUpperBasic_.reset();
        previousLowerBasic_.reset();
        previousFinal_.reset();
        upperBasic_.clear();
        lowerBasic_.clear();
        atrHistory_.clear();
    }

    void SupertrendIndicator::step(const CandleLog& log, size_t index) {
        const Candle& c = log.at(index);
        const Candle* prev = index > 0 ? &log.at(index - 1) : nullptr;

        double tr = trueRange(c, prev);
        if (!atr_) {
            atr_ = tr;
        }
        else {
            *atr_ += (tr - *atr_) / params_.period;
        }

        double hl2 = (c.high + c.low) / 2.0;
        double upper = hl2 + params_.multiplier * *atr_;
        double lower = hl2 - params_.multiplier * *atr_;

        IndicatorValue value;
        if (index >= static_cast<size_t>(params_.period)) {
            if (c.close > *previousUpperBasic_) {
                value = lower;
            }
            else if (c.close < *previousLowerBasic_) {
                value = upper;
            }
            else {
                value = previousFinal_;
            }
        }

        previousFinal_ = value;
        previousUpperBasic_ = upper;
        previousLowerBasic_ = lower;

        upperBasic_.push_back(upper);
        lowerBasic_.push_back(lower);
        atrHistory_.push_back(*atr_);
        output(OUTPUT).push_back(value);
    }

} // namespace candle
