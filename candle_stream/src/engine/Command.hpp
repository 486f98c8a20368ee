#pragma once

#include "core/Types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace candle {

    enum class CommandType {
        PAUSE,
        RESUME,
        SCROLL,
        ZOOM_IN,
        ZOOM_OUT,
        RESIZE_WINDOW,
        NARROW_WINDOW,
        WIDEN_WINDOW,
        SQUEEZE_IN,
        SQUEEZE_OUT,
        FOLLOW_LIVE,
        TOGGLE_INDICATOR,
        SET_INDICATOR_PARAMS
    };

    // One UI action. Only the fields relevant to `type` are read.
    struct Command {
        CommandType type = CommandType::PAUSE;
        int64_t position = 0;                       // SCROLL
        int size = 0;                               // RESIZE_WINDOW
        IndicatorKind indicator = IndicatorKind::EMA;
        bool enabled = false;                       // TOGGLE_INDICATOR
        IndicatorParams params;                     // SET_INDICATOR_PARAMS

        static Command pause() { return Command{ CommandType::PAUSE }; }
        static Command resume() { return Command{ CommandType::RESUME }; }
        static Command scroll(int64_t position);
        static Command resizeWindow(int size);
        static Command toggleIndicator(IndicatorKind kind, bool enabled);
        static Command setIndicatorParams(IndicatorKind kind, int period, double multiplier);
        static Command simple(CommandType type) { return Command{ type }; }

        // {"type": "scroll", "position": 40}
        // {"type": "toggleIndicator", "name": "RSI", "enabled": true}
        // {"type": "setIndicatorParams", "name": "Supertrend", "period": 10, "multiplier": 3}
        // Throws std::invalid_argument on an unknown type or indicator name,
        // nlohmann::json::exception on a missing or mistyped field.
        static Command fromJson(const nlohmann::json& j);
        nlohmann::json toJson() const;
    };

    std::string commandTypeToString(CommandType type);
    CommandType parseCommandType(const std::string& name);

} // namespace candle
