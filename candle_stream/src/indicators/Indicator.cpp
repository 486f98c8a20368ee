#include "Indicator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace candle {

    Indicator::Indicator(IndicatorKind kind, const IndicatorParams& params)
        : kind_(kind)
        , params_(params)
    {
        validateParams(params);
    }

    void Indicator::update(const CandleLog& log) {
        while (processed_ < log.size()) {
            step(log, processed_);
            processed_++;
        }
    }

    void Indicator::setParams(const IndicatorParams& params) {
        validateParams(params);
        params_ = params;
        reset();
    }

    void Indicator::reset() {
        for (auto& [name, series] : outputs_) {
            series.clear();
        }
        processed_ = 0;
        resetState();
    }

    const IndicatorSeries& Indicator::getOutput(const std::string& name) const {
        auto it = outputs_.find(name);
        if (it == outputs_.end()) {
            throw std::invalid_argument(getName() + " has no output named " + name);
        }
        return it->second;
    }

    void Indicator::validateParams(const IndicatorParams& params) {
        if (params.period < 1) {
            throw std::invalid_argument("Indicator period must be >= 1");
        }
        if (!std::isfinite(params.multiplier) || params.multiplier < 0.0) {
            throw std::invalid_argument("Indicator multiplier must be finite and >= 0");
        }
    }

    double trueRange(const Candle& current, const Candle* previous) {
        double highLow = current.high - current.low;
        if (!previous) return highLow;

        double highClose = std::abs(current.high - previous->close);
        double lowClose = std::abs(current.low - previous->close);
        return std::max({ highLow, highClose, lowClose });
    }

} // namespace candle
