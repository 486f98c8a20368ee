#pragma once

#include "Indicator.hpp"
#include <optional>
#include <vector>

namespace candle {

    // Supertrend over an exponentially smoothed ATR (alpha = 1 / period).
    //
    // Each final value depends on the previous final value and the previous
    // basic bands, so those are carried explicitly between steps:
    //   close > previous upper basic -> lower basic
    //   close < previous lower basic -> upper basic
    //   otherwise                    -> previous final value
    // Indices below `period` are undefined.
    class SupertrendIndicator : public Indicator {
    public:
        explicit SupertrendIndicator(const IndicatorParams& params = IndicatorParams{ 10, 3.0 });

        static constexpr const char* OUTPUT = "Supertrend";

        // Basic bands for every processed index (diagnostics)
        const std::vector<double>& getUpperBasic() const { return upperBasic_; }
        const std::vector<double>& getLowerBasic() const { return lowerBasic_; }
        const std::vector<double>& getAtr() const { return atrHistory_; }

        std::optional<double> getPreviousFinal() const { return previousFinal_; }

    protected:
        void step(const CandleLog& log, size_t index) override;
        void resetState() override;

    private:
        std::optional<double> atr_;
        std::optional<double> previousUpperBasic_;
        std::optional<double> previousLowerBasic_;
        std::optional<double> previousFinal_;

        std::vector<double> upperBasic_;
        std::vector<double> lowerBasic_;
        std::vector<double> atrHistory_;
    };

} // namespace candle
