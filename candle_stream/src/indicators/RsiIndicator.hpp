#pragma once

#include "Indicator.hpp"
#include <optional>

namespace candle {

    // Wilder RSI: gains and losses smoothed with alpha = 1 / period, seeded at
    // index 1 (index 0 has no prior close and stays undefined).
    //
    // Degenerate averages follow a fixed policy instead of producing NaN:
    //   avgLoss == 0 and avgGain > 0  -> 100
    //   avgLoss == 0 and avgGain == 0 -> 50 (flat market reads as neutral)
    class RsiIndicator : public Indicator {
    public:
        explicit RsiIndicator(const IndicatorParams& params = IndicatorParams{ 14, 0.0 });

        static constexpr const char* OUTPUT = "RSI";

        static IndicatorValue fromAverages(double avgGain, double avgLoss);

        std::optional<double> getAvgGain() const { return avgGain_; }
        std::optional<double> getAvgLoss() const { return avgLoss_; }

    protected:
        void step(const CandleLog& log, size_t index) override;
        void resetState() override;

    private:
        std::optional<double> avgGain_;
        std::optional<double> avgLoss_;
    };

} // namespace candle
