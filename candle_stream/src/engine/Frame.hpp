#pragma once

#include "core/Types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace candle {

    // Immutable snapshot handed to the renderer after every tick or command
    struct Frame {
        uint64_t sequence = 0;
        PlaybackState state = PlaybackState::RUNNING;
        size_t totalCandles = 0;
        size_t startIndex = 0;
        size_t windowSize = 0;
        double zoomBufferFraction = 0.0;
        double bodyWidth = 0.0;

        std::vector<Candle> visibleCandles;

        // Enabled series only, each the same length as visibleCandles
        std::map<std::string, IndicatorSeries> indicatorValues;

        // Absent while the log is empty
        std::optional<AxisRanges> ranges;

        nlohmann::json toJson() const;
    };

    nlohmann::json candleToJson(const Candle& c);

    // Requires time/open/high/low/close; volume is optional.
    // Throws nlohmann::json::exception on missing or mistyped fields and
    // std::invalid_argument on a negative or fractional time or volume.
    Candle candleFromJson(const nlohmann::json& j);

    nlohmann::json seriesToJson(const IndicatorSeries& series);

} // namespace candle
