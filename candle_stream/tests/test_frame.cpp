#include <catch2/catch_test_macros.hpp>
#include "engine/Frame.hpp"
#include "engine/Command.hpp"
#include <stdexcept>

using namespace candle;

TEST_CASE("Frame: undefined indicator values serialise as null", "[frame]") {
    Frame frame;
    frame.sequence = 3;
    frame.state = PlaybackState::PAUSED;
    frame.indicatorValues["RSI"] = { std::nullopt, 55.0 };

    auto j = frame.toJson();
    REQUIRE(j["sequence"] == 3);
    REQUIRE(j["state"] == "paused");
    REQUIRE(j["indicatorValues"]["RSI"][0].is_null());
    REQUIRE(j["indicatorValues"]["RSI"][1] == 55.0);
}

TEST_CASE("Frame: ranges are null while the log is empty", "[frame]") {
    Frame frame;
    auto j = frame.toJson();
    REQUIRE(j["timeRange"].is_null());
    REQUIRE(j["priceRange"].is_null());
    REQUIRE(j["visibleCandles"].empty());

    frame.ranges = AxisRanges{ TimeRange{ 1000, 5000 }, PriceRange{ 90.0, 110.0 } };
    j = frame.toJson();
    REQUIRE(j["timeRange"][0] == 1000);
    REQUIRE(j["timeRange"][1] == 5000);
    REQUIRE(j["priceRange"][0] == 90.0);
    REQUIRE(j["priceRange"][1] == 110.0);
}

TEST_CASE("Frame: candle JSON carries OHLC and optional volume", "[frame]") {
    Candle c;
    c.time = 1704164645000ULL;
    c.open = 1.0;
    c.high = 2.0;
    c.low = 0.5;
    c.close = 1.5;

    auto j = candleToJson(c);
    REQUIRE(j["label"] == "03:04:05");
    REQUIRE(j["volume"].is_null());

    c.volume = 300;
    Candle back = candleFromJson(candleToJson(c));
    REQUIRE(back.time == c.time);
    REQUIRE(back.close == 1.5);
    REQUIRE(back.volume == c.volume);
}

TEST_CASE("Frame: candleFromJson requires every price", "[frame]") {
    nlohmann::json j = { {"time", 1000}, {"open", 1.0}, {"high", 2.0}, {"close", 1.5} };
    REQUIRE_THROWS_AS(candleFromJson(j), nlohmann::json::exception);
}

TEST_CASE("Frame: candleFromJson rejects negative or fractional times", "[frame]") {
    nlohmann::json j = { {"time", -1}, {"open", 1.0}, {"high", 2.0}, {"low", 0.5}, {"close", 1.5} };
    REQUIRE_THROWS_AS(candleFromJson(j), std::invalid_argument);

    j["time"] = 1000.5;
    REQUIRE_THROWS_AS(candleFromJson(j), std::invalid_argument);

    j["time"] = "1000";
    REQUIRE_THROWS_AS(candleFromJson(j), std::invalid_argument);

    // Parsed text yields an unsigned number, a literal yields a signed one
    REQUIRE(candleFromJson(nlohmann::json::parse(
        R"({"time": 2000, "open": 1, "high": 2, "low": 0.5, "close": 1.5})")).time == 2000);
    j["time"] = 2000;
    REQUIRE(candleFromJson(j).time == 2000);
}

TEST_CASE("Frame: candleFromJson rejects negative or fractional volumes", "[frame]") {
    nlohmann::json j = { {"time", 1000}, {"open", 1.0}, {"high", 2.0}, {"low", 0.5}, {"close", 1.5} };

    j["volume"] = -5;
    REQUIRE_THROWS_AS(candleFromJson(j), std::invalid_argument);

    j["volume"] = 12.5;
    REQUIRE_THROWS_AS(candleFromJson(j), std::invalid_argument);

    j["volume"] = 0;
    REQUIRE(candleFromJson(j).volume == Volume(0));
}

TEST_CASE("Command: parses every command type", "[frame]") {
    auto scroll = Command::fromJson({ {"type", "scroll"}, {"position", 12} });
    REQUIRE(scroll.type == CommandType::SCROLL);
    REQUIRE(scroll.position == 12);

    auto resize = Command::fromJson({ {"type", "resizeWindow"}, {"size", 40} });
    REQUIRE(resize.type == CommandType::RESIZE_WINDOW);
    REQUIRE(resize.size == 40);

    auto toggle = Command::fromJson({ {"type", "toggleIndicator"}, {"name", "ATRBands"}, {"enabled", true} });
    REQUIRE(toggle.type == CommandType::TOGGLE_INDICATOR);
    REQUIRE(toggle.indicator == IndicatorKind::ATR_BANDS);
    REQUIRE(toggle.enabled);

    auto params = Command::fromJson({ {"type", "setIndicatorParams"}, {"name", "supertrend"},
                                      {"period", 7}, {"multiplier", 2.5} });
    REQUIRE(params.indicator == IndicatorKind::SUPERTREND);
    REQUIRE(params.params.period == 7);
    REQUIRE(params.params.multiplier == 2.5);

    for (auto type : { CommandType::PAUSE, CommandType::RESUME, CommandType::ZOOM_IN,
                       CommandType::ZOOM_OUT, CommandType::NARROW_WINDOW, CommandType::WIDEN_WINDOW,
                       CommandType::SQUEEZE_IN, CommandType::SQUEEZE_OUT, CommandType::FOLLOW_LIVE }) {
        REQUIRE(Command::fromJson(Command::simple(type).toJson()).type == type);
    }
}

TEST_CASE("Command: rejects unknown types and missing fields", "[frame]") {
    REQUIRE_THROWS_AS(Command::fromJson({ {"type", "rewind"} }), std::invalid_argument);
    REQUIRE_THROWS_AS(Command::fromJson({ {"type", "scroll"} }), nlohmann::json::exception);
    REQUIRE_THROWS_AS(Command::fromJson({ {"type", "toggleIndicator"}, {"name", "MACD"}, {"enabled", true} }),
        std::invalid_argument);
}
