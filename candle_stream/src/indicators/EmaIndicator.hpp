#pragma once

#include "Indicator.hpp"
#include <optional>

namespace candle {

    // Exponential moving average of close, alpha = 2 / (period + 1).
    // Seeded with the first close, so it is defined from index 0.
    class EmaIndicator : public Indicator {
    public:
        explicit EmaIndicator(const IndicatorParams& params = IndicatorParams{ 14, 0.0 });

        static constexpr const char* OUTPUT = "EMA";

        double getAlpha() const { return 2.0 / (params_.period + 1.0); }

    protected:
        void step(const CandleLog& log, size_t index) override;
        void resetState() override { ema_.reset(); }

    private:
        std::optional<double> ema_;
    };

} // namespace candle
