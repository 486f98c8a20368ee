#pragma once

#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace candle {

    /// Central, JSON-serialisable configuration for every tunable knob of a
    /// chart session.  Every sub-struct carries working defaults so a session
    /// runs out-of-the-box.  Hot values can be patched at runtime via the
    /// REST API (POST /config).

    struct RuntimeConfig {

        // ---- Playback cadence ----------------------------------------------------
        struct PlaybackParams {
            int      tickRateMs = 500;
            int      maxTicks = 0;           // 0 = unlimited
            int      seedCandles = 30;       // history generated before the first tick
            uint64_t candleIntervalMs = 1000;
            std::string startTime;           // "YYYY-MM-DD HH:MM:SS" UTC, empty = now
        } playback;

        // ---- Synthetic candle generator -----------------------------------------
        struct GeneratorParams {
            double initialPrice = 100.0;
            double noiseStd = 0.5;
            double wickScale = 0.5;          // wick = |noise| * U(0, wickScale)
            int    volumeMin = 100;
            int    volumeMax = 1000;
            unsigned int seed = 0;           // 0 = nondeterministic
        } generator;

        // ---- Visible window ------------------------------------------------------
        struct ViewParams {
            int    windowSize = 30;
            double zoomBufferFraction = 0.05;
            double bodyWidth = 0.6;
        } view;

        // ---- Indicators ----------------------------------------------------------
        struct IndicatorToggle {
            bool   enabled = false;
            int    period = 14;
            double multiplier = 0.0;

            IndicatorParams params() const { return IndicatorParams{ period, multiplier }; }
        };

        struct IndicatorSet {
            IndicatorToggle ema{ false, 14, 0.0 };
            IndicatorToggle rsi{ false, 14, 0.0 };
            IndicatorToggle supertrend{ false, 10, 3.0 };
            IndicatorToggle atrBands{ false, 20, 2.0 };

            IndicatorToggle& get(IndicatorKind kind) {
                switch (kind) {
                case IndicatorKind::EMA:        return ema;
                case IndicatorKind::RSI:        return rsi;
                case IndicatorKind::SUPERTREND: return supertrend;
                case IndicatorKind::ATR_BANDS:  return atrBands;
                }
                return ema;
            }

            const IndicatorToggle& get(IndicatorKind kind) const {
                return const_cast<IndicatorSet*>(this)->get(kind);
            }
        } indicators;

        // ---- Logging -------------------------------------------------------------
        struct LoggingParams {
            std::string file = "candle_stream.log";
            std::string level = "info";
            bool console = true;
        } logging;

        // ---- HTTP transport ------------------------------------------------------
        struct ApiParams {
            std::string host = "0.0.0.0";
            int port = 8080;
        } api;

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["playback"] = {
                {"tickRateMs",       playback.tickRateMs},
                {"maxTicks",         playback.maxTicks},
                {"seedCandles",      playback.seedCandles},
                {"candleIntervalMs", playback.candleIntervalMs},
                {"startTime",        playback.startTime}
            };

            j["generator"] = {
                {"initialPrice", generator.initialPrice},
                {"noiseStd",     generator.noiseStd},
                {"wickScale",    generator.wickScale},
                {"volumeMin",    generator.volumeMin},
                {"volumeMax",    generator.volumeMax},
                {"seed",         generator.seed}
            };

            j["view"] = {
                {"windowSize",         view.windowSize},
                {"zoomBufferFraction", view.zoomBufferFraction},
                {"bodyWidth",          view.bodyWidth}
            };

            auto toggleJson = [](const IndicatorToggle& t) {
                return nlohmann::json{
                    {"enabled",    t.enabled},
                    {"period",     t.period},
                    {"multiplier", t.multiplier}
                };
                };

            j["indicators"] = {
                {"ema",        toggleJson(indicators.ema)},
                {"rsi",        toggleJson(indicators.rsi)},
                {"supertrend", toggleJson(indicators.supertrend)},
                {"atrBands",   toggleJson(indicators.atrBands)}
            };

            j["logging"] = {
                {"file",    logging.file},
                {"level",   logging.level},
                {"console", logging.console}
            };

            j["api"] = {
                {"host", api.host},
                {"port", api.port}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("playback")) {
                auto& p = j["playback"];
                get(p, "tickRateMs", playback.tickRateMs);
                get(p, "maxTicks", playback.maxTicks);
                get(p, "seedCandles", playback.seedCandles);
                get(p, "candleIntervalMs", playback.candleIntervalMs);
                get(p, "startTime", playback.startTime);
            }

            if (j.contains("generator")) {
                auto& g = j["generator"];
                get(g, "initialPrice", generator.initialPrice);
                get(g, "noiseStd", generator.noiseStd);
                get(g, "wickScale", generator.wickScale);
                get(g, "volumeMin", generator.volumeMin);
                get(g, "volumeMax", generator.volumeMax);
                get(g, "seed", generator.seed);
            }

            if (j.contains("view")) {
                auto& v = j["view"];
                get(v, "windowSize", view.windowSize);
                get(v, "zoomBufferFraction", view.zoomBufferFraction);
                get(v, "bodyWidth", view.bodyWidth);
            }

            if (j.contains("indicators")) {
                auto& ind = j["indicators"];
                auto getToggle = [&get](const nlohmann::json& obj, const char* key, IndicatorToggle& t) {
                    if (!obj.contains(key)) return;
                    auto& o = obj[key];
                    get(o, "enabled", t.enabled);
                    get(o, "period", t.period);
                    get(o, "multiplier", t.multiplier);
                    };
                getToggle(ind, "ema", indicators.ema);
                getToggle(ind, "rsi", indicators.rsi);
                getToggle(ind, "supertrend", indicators.supertrend);
                getToggle(ind, "atrBands", indicators.atrBands);
            }

            if (j.contains("logging")) {
                auto& l = j["logging"];
                get(l, "file", logging.file);
                get(l, "level", logging.level);
                get(l, "console", logging.console);
            }

            if (j.contains("api")) {
                auto& a = j["api"];
                get(a, "host", api.host);
                get(a, "port", api.port);
            }
        }
    };

} // namespace candle
