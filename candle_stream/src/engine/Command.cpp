#include "Command.hpp"
#include <map>
#include <stdexcept>

namespace candle {

    namespace {
        const std::map<CommandType, std::string>& commandNames() {
            static const std::map<CommandType, std::string> names = {
                {CommandType::PAUSE, "pause"},
                {CommandType::RESUME, "resume"},
                {CommandType::SCROLL, "scroll"},
                {CommandType::ZOOM_IN, "zoomIn"},
                {CommandType::ZOOM_OUT, "zoomOut"},
                {CommandType::RESIZE_WINDOW, "resizeWindow"},
                {CommandType::NARROW_WINDOW, "narrowWindow"},
                {CommandType::WIDEN_WINDOW, "widenWindow"},
                {CommandType::SQUEEZE_IN, "squeezeIn"},
                {CommandType::SQUEEZE_OUT, "squeezeOut"},
                {CommandType::FOLLOW_LIVE, "followLive"},
                {CommandType::TOGGLE_INDICATOR, "toggleIndicator"},
                {CommandType::SET_INDICATOR_PARAMS, "setIndicatorParams"}
            };
            return names;
        }
    }

    Command Command::scroll(int64_t position) {
        Command c{ CommandType::SCROLL };
        c.position = position;
        return c;
    }

    Command Command::resizeWindow(int size) {
        Command c{ CommandType::RESIZE_WINDOW };
        c.size = size;
        return c;
    }

    Command Command::toggleIndicator(IndicatorKind kind, bool enabled) {
        Command c{ CommandType::TOGGLE_INDICATOR };
        c.indicator = kind;
        c.enabled = enabled;
        return c;
    }

    Command Command::setIndicatorParams(IndicatorKind kind, int period, double multiplier) {
        Command c{ CommandType::SET_INDICATOR_PARAMS };
        c.indicator = kind;
        c.params = IndicatorParams{ period, multiplier };
        return c;
    }

    Command Command::fromJson(const nlohmann::json& j) {
        Command c{ parseCommandType(j.at("type").get<std::string>()) };

        switch (c.type) {
        case CommandType::SCROLL:
            c.position = j.at("position").get<int64_t>();
            break;
        case CommandType::RESIZE_WINDOW:
            c.size = j.at("size").get<int>();
            break;
        case CommandType::TOGGLE_INDICATOR:
            c.indicator = parseIndicatorKind(j.at("name").get<std::string>());
            c.enabled = j.at("enabled").get<bool>();
            break;
        case CommandType::SET_INDICATOR_PARAMS:
            c.indicator = parseIndicatorKind(j.at("name").get<std::string>());
            c.params.period = j.at("period").get<int>();
            c.params.multiplier = j.value("multiplier", 0.0);
            break;
        default:
            break;
        }
        return c;
    }

    nlohmann::json Command::toJson() const {
        nlohmann::json j;
        j["type"] = commandTypeToString(type);

        switch (type) {
        case CommandType::SCROLL:
            j["position"] = position;
            break;
        case CommandType::RESIZE_WINDOW:
            j["size"] = size;
            break;
        case CommandType::TOGGLE_INDICATOR:
            j["name"] = indicatorKindToString(indicator);
            j["enabled"] = enabled;
            break;
        case CommandType::SET_INDICATOR_PARAMS:
            j["name"] = indicatorKindToString(indicator);
            j["period"] = params.period;
            j["multiplier"] = params.multiplier;
            break;
        default:
            break;
        }
        return j;
    }

    std::string commandTypeToString(CommandType type) {
        return commandNames().at(type);
    }

    CommandType parseCommandType(const std::string& name) {
        for (const auto& [type, text] : commandNames()) {
            if (text == name) return type;
        }
        throw std::invalid_argument("Unknown command type: " + name);
    }

} // namespace candle
