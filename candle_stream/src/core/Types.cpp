#include "Types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace candle {

    std::string indicatorKindToString(IndicatorKind kind) {
        switch (kind) {
        case IndicatorKind::EMA:        return "EMA";
        case IndicatorKind::RSI:        return "RSI";
        case IndicatorKind::SUPERTREND: return "Supertrend";
        case IndicatorKind::ATR_BANDS:  return "ATRBands";
        }
        return "EMA";
    }

    IndicatorKind parseIndicatorKind(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "ema") return IndicatorKind::EMA;
        if (lower == "rsi") return IndicatorKind::RSI;
        if (lower == "supertrend") return IndicatorKind::SUPERTREND;
        if (lower == "atrbands" || lower == "atr_bands") return IndicatorKind::ATR_BANDS;

        throw std::invalid_argument("Unknown indicator: " + name);
    }

    std::string playbackStateToString(PlaybackState state) {
        return state == PlaybackState::RUNNING ? "running" : "paused";
    }

} // namespace candle
