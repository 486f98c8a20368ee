#pragma once

#include "core/Types.hpp"
#include "core/CandleLog.hpp"
#include "core/CandleClock.hpp"
#include "core/RuntimeConfig.hpp"
#include "utils/Random.hpp"

namespace candle {

    // Random-walk candle synthesis. Each candle opens at the previous close:
    //   close = open + N(0, noiseStd)
    //   high  = max(open, close) + |noise| * U(0, wickScale)
    //   low   = min(open, close) - |noise| * U(0, wickScale)
    class CandleGenerator {
    public:
        explicit CandleGenerator(const RuntimeConfig::GeneratorParams& params = {});

        // Keeps the random stream unless the seed changes
        void setParams(const RuntimeConfig::GeneratorParams& params);

        // Restart the random stream; 0 = nondeterministic
        void reseed(unsigned int seed) { random_.reseed(seed); }
        const RuntimeConfig::GeneratorParams& getParams() const { return params_; }

        // Next candle after log.back(); an empty log opens at initialPrice at
        // the clock's current time. Advances the clock by one interval otherwise.
        Candle next(const CandleLog& log, CandleClock& clock);

        // Price part only, for a given open
        Candle synthesize(Price open, Timestamp time);

    private:
        RuntimeConfig::GeneratorParams params_;
        Random random_;
    };

} // namespace candle
