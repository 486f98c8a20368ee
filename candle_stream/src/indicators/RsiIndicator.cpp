#include "RsiIndicator.hpp"
#include <algorithm>
#include <cmath>

namespace candle {

    RsiIndicator::RsiIndicator(const IndicatorParams& params)
        : Indicator(IndicatorKind::RSI, params)
    {
        output(OUTPUT);
    }

    void RsiIndicator::resetState() {
        avgGain_.reset();
        avgLoss_.reset();
    }

    IndicatorValue RsiIndicator::fromAverages(double avgGain, double avgLoss) {
        if (avgLoss == 0.0) {
            return avgGain > 0.0 ? 100.0 : 50.0;
        }

        double rs = avgGain / avgLoss;
        double rsi = 100.0 - 100.0 / (1.0 + rs);
        if (!std::isfinite(rsi)) return std::nullopt;

        return std::clamp(rsi, 0.0, 100.0);
    }

    void RsiIndicator::step(const CandleLog& log, size_t index) {
        if (index == 0) {
            output(OUTPUT).push_back(std::nullopt);
            return;
        }

        double delta = log.at(index).close - log.at(index - 1).close;
        double gain = std::max(delta, 0.0);
        double loss = std::max(-delta, 0.0);

        if (!avgGain_ || !avgLoss_) {
            avgGain_ = gain;
            avgLoss_ = loss;
        }
        else {
            double alpha = 1.0 / params_.period;
            *avgGain_ += alpha * (gain - *avgGain_);
            *avgLoss_ += alpha * (loss - *avgLoss_);
        }

        output(OUTPUT).push_back(fromAverages(*avgGain_, *avgLoss_));
    }

} // namespace candle
