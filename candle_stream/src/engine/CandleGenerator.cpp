#include "CandleGenerator.hpp"
#include <algorithm>
#include <cmath>

namespace candle {

    CandleGenerator::CandleGenerator(const RuntimeConfig::GeneratorParams& params)
        : params_(params)
        , random_(params.seed)
    {
    }

    void CandleGenerator::setParams(const RuntimeConfig::GeneratorParams& params) {
        bool reseedNeeded = params.seed != params_.seed;
        params_ = params;
        if (reseedNeeded) {
            random_.reseed(params_.seed);
        }
    }

    Candle CandleGenerator::next(const CandleLog& log, CandleClock& clock) {
        if (log.empty()) {
            return synthesize(params_.initialPrice, clock.getCurrentTime());
        }

        const Candle& last = log.back();
        clock.syncTo(last.time);
        return synthesize(last.close, clock.tick());
    }

    Candle CandleGenerator::synthesize(Price open, Timestamp time) {
        double noise = random_.normal(0.0, params_.noiseStd);
        double wickScale = std::max(0.0, params_.wickScale);

        Candle c;
        c.time = time;
        c.open = open;
        c.close = open + noise;
        c.high = std::max(c.open, c.close) + std::abs(noise) * random_.uniform(0.0, wickScale);
        c.low = std::min(c.open, c.close) - std::abs(noise) * random_.uniform(0.0, wickScale);

        int lo = std::max(0, std::min(params_.volumeMin, params_.volumeMax));
        int hi = std::max(lo, std::max(params_.volumeMin, params_.volumeMax));
        c.volume = static_cast<Volume>(random_.uniformInt(lo, hi));
        return c;
    }

} // namespace candle
