#pragma once

#include <random>
#include <cmath>

namespace candle {

// Seedable random source owned by one generator, so two sessions with the
// same seed replay the same candles.
class Random {
public:
    // seed 0 = nondeterministic
    explicit Random(unsigned int seed = 0) {
        reseed(seed);
    }

    void reseed(unsigned int seed) {
        engine_.seed(seed != 0 ? seed : std::random_device{}());
    }

    // Uniform distribution [min, max]
    double uniform(double min, double max) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(engine_);
    }

    // Uniform integer [min, max]
    int uniformInt(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(engine_);
    }

    // Normal distribution; stddev <= 0 collapses to the mean
    double normal(double mean, double stddev) {
        if (stddev <= 0.0) return mean;
        std::normal_distribution<double> dist(mean, stddev);
        return dist(engine_);
    }

private:
    std::mt19937 engine_;
};

} // namespace candle
