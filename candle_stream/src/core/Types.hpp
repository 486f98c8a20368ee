#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <vector>
#include <map>

namespace candle {

    using Price = double;
    using Volume = int64_t;
    using Timestamp = uint64_t;   // epoch milliseconds

    struct Candle {
        Timestamp time = 0;
        Price open = 0.0;
        Price high = 0.0;
        Price low = 0.0;
        Price close = 0.0;
        std::optional<Volume> volume;

        bool isBullish() const { return close >= open; }
    };

    // index -> value; std::nullopt marks "no value yet"
    using IndicatorValue = std::optional<double>;
    using IndicatorSeries = std::vector<IndicatorValue>;

    enum class IndicatorKind {
        EMA,
        RSI,
        SUPERTREND,
        ATR_BANDS
    };

    struct IndicatorParams {
        int period = 14;
        double multiplier = 0.0;   // unused by EMA and RSI
    };

    enum class PlaybackState {
        RUNNING,
        PAUSED
    };

    struct TimeRange {
        Timestamp min = 0;
        Timestamp max = 0;
    };

    struct PriceRange {
        Price min = 0.0;
        Price max = 0.0;
    };

    struct AxisRanges {
        TimeRange time;
        PriceRange price;
    };

    inline Timestamp now() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

    std::string indicatorKindToString(IndicatorKind kind);

    // Accepts "EMA", "RSI", "Supertrend", "ATRBands" (case-insensitive)
    IndicatorKind parseIndicatorKind(const std::string& name);

    std::string playbackStateToString(PlaybackState state);

} // namespace candle
