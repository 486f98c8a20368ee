#include "Frame.hpp"
#include "core/CandleClock.hpp"
#include <stdexcept>

namespace candle {

    nlohmann::json candleToJson(const Candle& c) {
        nlohmann::json j = {
            {"time", c.time},
            {"label", CandleClock::formatTime(c.time)},
            {"open", c.open},
            {"high", c.high},
            {"low", c.low},
            {"close", c.close}
        };
        if (c.volume) {
            j["volume"] = *c.volume;
        }
        else {
            j["volume"] = nullptr;
        }
        return j;
    }

    Candle candleFromJson(const nlohmann::json& j) {
        const auto& time = j.at("time");
        if (!time.is_number_unsigned() &&
            !(time.is_number_integer() && time.get<int64_t>() >= 0)) {
            throw std::invalid_argument("Candle time must be a non-negative integer (epoch ms)");
        }

        Candle c;
        c.time = time.get<Timestamp>();
        c.open = j.at("open").get<Price>();
        c.high = j.at("high").get<Price>();
        c.low = j.at("low").get<Price>();
        c.close = j.at("close").get<Price>();
        if (j.contains("volume") && !j["volume"].is_null()) {
            const auto& volume = j["volume"];
            if (!volume.is_number_integer() ||
                (!volume.is_number_unsigned() && volume.get<int64_t>() < 0)) {
                throw std::invalid_argument("Candle volume must be a non-negative integer");
            }
            c.volume = volume.get<Volume>();
        }
        return c;
    }

    nlohmann::json seriesToJson(const IndicatorSeries& series) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& v : series) {
            if (v) arr.push_back(*v);
            else arr.push_back(nullptr);
        }
        return arr;
    }

    nlohmann::json Frame::toJson() const {
        nlohmann::json j;
        j["sequence"] = sequence;
        j["state"] = playbackStateToString(state);
        j["totalCandles"] = totalCandles;
        j["startIndex"] = startIndex;
        j["windowSize"] = windowSize;
        j["zoomBufferFraction"] = zoomBufferFraction;
        j["bodyWidth"] = bodyWidth;

        nlohmann::json candles = nlohmann::json::array();
        for (const auto& c : visibleCandles) {
            candles.push_back(candleToJson(c));
        }
        j["visibleCandles"] = candles;

        nlohmann::json indicators = nlohmann::json::object();
        for (const auto& [name, series] : indicatorValues) {
            indicators[name] = seriesToJson(series);
        }
        j["indicatorValues"] = indicators;

        if (ranges) {
            j["timeRange"] = { ranges->time.min, ranges->time.max };
            j["priceRange"] = { ranges->price.min, ranges->price.max };
        }
        else {
            j["timeRange"] = nullptr;
            j["priceRange"] = nullptr;
        }
        return j;
    }

} // namespace candle
