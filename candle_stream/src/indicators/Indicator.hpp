#pragma once

#include "core/Types.hpp"
#include "core/CandleLog.hpp"
#include <map>
#include <string>
#include <vector>

namespace candle {

    // Base for the streaming indicators. Each subclass carries the O(1) or
    // O(period) state needed to extend its outputs by exactly one index.
    class Indicator {
    public:
        Indicator(IndicatorKind kind, const IndicatorParams& params);
        virtual ~Indicator() = default;

        // Extend every output up to log.size(). On the live path this is one
        // step; after a pause in updates it replays only the missed candles.
        void update(const CandleLog& log);

        // Validate, store and drop all state; the next update rebuilds from 0
        void setParams(const IndicatorParams& params);

        void reset();

        IndicatorKind getKind() const { return kind_; }
        const IndicatorParams& getParams() const { return params_; }
        std::string getName() const { return indicatorKindToString(kind_); }

        // Number of candle indices already folded into the outputs
        size_t getProcessedCount() const { return processed_; }

        // Published series keyed by name ("EMA", "ATR_Upper", ...)
        const std::map<std::string, IndicatorSeries>& getOutputs() const { return outputs_; }
        const IndicatorSeries& getOutput(const std::string& name) const;

        // Throws std::invalid_argument for period < 1 or a negative/non-finite multiplier
        static void validateParams(const IndicatorParams& params);

    protected:
        // Fold candle `index` into the state; index == getProcessedCount()
        virtual void step(const CandleLog& log, size_t index) = 0;

        virtual void resetState() = 0;

        IndicatorSeries& output(const std::string& name) { return outputs_[name]; }

        IndicatorKind kind_;
        IndicatorParams params_;

    private:
        std::map<std::string, IndicatorSeries> outputs_;
        size_t processed_ = 0;
    };

    // True range; the first candle has no prior close and uses high - low
    double trueRange(const Candle& current, const Candle* previous);

} // namespace candle
