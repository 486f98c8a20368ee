#pragma once

#include "Indicator.hpp"
#include "core/RuntimeConfig.hpp"
#include <map>
#include <memory>
#include <string>

namespace candle {

    // Owns one instance of every indicator kind and advances the enabled ones
    // once per appended candle. Disabled indicators keep their state; on
    // re-enable they replay only the candles they missed.
    class IndicatorEngine {
    public:
        IndicatorEngine();

        // Apply toggles and parameters from config (resets changed indicators)
        void configure(const RuntimeConfig::IndicatorSet& config, const CandleLog& log);

        // Called once per appended candle
        void update(const CandleLog& log);

        void enable(IndicatorKind kind, const CandleLog& log);
        void disable(IndicatorKind kind);
        void setEnabled(IndicatorKind kind, bool enabled, const CandleLog& log);
        bool isEnabled(IndicatorKind kind) const;

        // Replaces the parameters and rebuilds the indicator from index 0
        void setParams(IndicatorKind kind, const IndicatorParams& params, const CandleLog& log);

        const Indicator& get(IndicatorKind kind) const;

        // Outputs of every enabled indicator restricted to [start, end)
        std::map<std::string, IndicatorSeries> sliceOutputs(size_t start, size_t end) const;

    private:
        struct Slot {
            std::unique_ptr<Indicator> indicator;
            bool enabled = false;
        };

        std::map<IndicatorKind, Slot> slots_;

        Slot& slot(IndicatorKind kind);
        const Slot& slot(IndicatorKind kind) const;
    };

} // namespace candle
