#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "engine/PlaybackController.hpp"
#include "core/Errors.hpp"
#include <atomic>
#include <chrono>
#include <limits>
#include <thread>

using namespace candle;

namespace {
    void configure(PlaybackController& playback, int seedCandles = 30) {
        auto& cfg = playback.getRuntimeConfig();
        cfg.playback.seedCandles = seedCandles;
        cfg.playback.startTime = "2024-01-02 00:00:00";
        cfg.playback.candleIntervalMs = 1000;
        cfg.generator.seed = 42;
        cfg.view.windowSize = 10;
        playback.initialize();
    }
}

TEST_CASE("Playback: initialize seeds history and publishes a frame", "[playback]") {
    PlaybackController playback;
    configure(playback, 30);

    auto frame = playback.latestFrame();
    REQUIRE(frame->totalCandles == 30);
    REQUIRE(frame->windowSize == 10);
    REQUIRE(frame->startIndex == 20);
    REQUIRE(frame->visibleCandles.size() == 10);
    REQUIRE(frame->ranges.has_value());
    REQUIRE(frame->state == PlaybackState::RUNNING);
    REQUIRE(frame->indicatorValues.empty());
}

TEST_CASE("Playback: empty session has no ranges", "[playback]") {
    PlaybackController playback;
    configure(playback, 0);

    auto frame = playback.latestFrame();
    REQUIRE(frame->totalCandles == 0);
    REQUIRE(frame->visibleCandles.empty());
    REQUIRE_FALSE(frame->ranges.has_value());
}

TEST_CASE("Playback: step appends one candle per step and follows the live edge", "[playback]") {
    PlaybackController playback;
    configure(playback, 30);

    playback.step(5);
    auto frame = playback.latestFrame();
    REQUIRE(frame->totalCandles == 35);
    REQUIRE(frame->startIndex == 25);
    REQUIRE(playback.getCurrentTick() == 5);
    REQUIRE(frame->visibleCandles.back().time == frame->visibleCandles.front().time + 9000);
}

TEST_CASE("Playback: pause and resume change state", "[playback]") {
    PlaybackController playback;
    configure(playback);

    Frame paused = playback.dispatch(Command::pause());
    REQUIRE(paused.state == PlaybackState::PAUSED);
    REQUIRE(playback.isPaused());

    Frame resumed = playback.dispatch(Command::resume());
    REQUIRE(resumed.state == PlaybackState::RUNNING);
    REQUIRE(resumed.sequence > paused.sequence);
}

TEST_CASE("Playback: view commands work while paused", "[playback]") {
    PlaybackController playback;
    configure(playback, 50);
    playback.pause();

    Frame f = playback.dispatch(Command::scroll(5));
    REQUIRE(f.startIndex == 5);
    REQUIRE(f.state == PlaybackState::PAUSED);

    f = playback.dispatch(Command::simple(CommandType::ZOOM_IN));
    REQUIRE(f.zoomBufferFraction == Catch::Approx(0.04));

    f = playback.dispatch(Command::resizeWindow(20));
    REQUIRE(f.windowSize == 20);
    REQUIRE(f.visibleCandles.size() == 20);

    f = playback.dispatch(Command::simple(CommandType::FOLLOW_LIVE));
    REQUIRE(f.startIndex == 30);
}

TEST_CASE("Playback: a scrolled view stays fixed while candles arrive", "[playback]") {
    PlaybackController playback;
    configure(playback, 40);

    playback.dispatch(Command::scroll(3));
    playback.step(4);
    REQUIRE(playback.latestFrame()->startIndex == 3);
    REQUIRE(playback.latestFrame()->totalCandles == 44);
}

TEST_CASE("Playback: toggled indicators appear sliced to the window", "[playback]") {
    PlaybackController playback;
    configure(playback, 30);

    Frame f = playback.dispatch(Command::toggleIndicator(IndicatorKind::ATR_BANDS, true));
    REQUIRE(f.indicatorValues.size() == 2);
    REQUIRE(f.indicatorValues.at("ATR_Upper").size() == f.visibleCandles.size());
    REQUIRE(playback.getRuntimeConfig().indicators.atrBands.enabled);

    f = playback.dispatch(Command::toggleIndicator(IndicatorKind::EMA, true));
    REQUIRE(f.indicatorValues.count("EMA") == 1);

    f = playback.dispatch(Command::toggleIndicator(IndicatorKind::ATR_BANDS, false));
    REQUIRE(f.indicatorValues.size() == 1);
}

TEST_CASE("Playback: setIndicatorParams rebuilds and validates", "[playback]") {
    PlaybackController playback;
    configure(playback, 30);
    playback.dispatch(Command::toggleIndicator(IndicatorKind::SUPERTREND, true));

    Frame f = playback.dispatch(Command::setIndicatorParams(IndicatorKind::SUPERTREND, 5, 2.0));
    REQUIRE(f.indicatorValues.at("Supertrend").size() == 10);
    REQUIRE(playback.getRuntimeConfig().indicators.supertrend.period == 5);

    REQUIRE_THROWS_AS(playback.dispatch(Command::setIndicatorParams(IndicatorKind::SUPERTREND, 0, 2.0)),
        std::invalid_argument);
    REQUIRE(playback.getRuntimeConfig().indicators.supertrend.period == 5);
}

TEST_CASE("Playback: injected candles go through validation", "[playback]") {
    PlaybackController playback;
    configure(playback, 10);

    Candle last;
    {
        std::shared_lock<std::shared_mutex> lock(playback.getMutex());
        last = playback.getLog().back();
    }

    Candle good;
    good.time = last.time + 1000;
    good.open = last.close;
    good.high = last.close + 1.0;
    good.low = last.close - 1.0;
    good.close = last.close + 0.5;

    Frame f = playback.inject(good);
    REQUIRE(f.totalCandles == 11);
    REQUIRE(f.visibleCandles.back().close == good.close);

    Candle bad = good;
    bad.time = good.time + 1000;
    bad.high = bad.close - 0.1;
    REQUIRE_THROWS_AS(playback.inject(bad), InvalidCandle);
    REQUIRE(playback.latestFrame()->totalCandles == 11);

    // Generated candles continue from the injected one
    playback.step(1);
    REQUIRE(playback.latestFrame()->visibleCandles.back().time == good.time + 1000);
}

TEST_CASE("Playback: an injected time without headroom cannot stall the generator", "[playback]") {
    PlaybackController playback;
    configure(playback, 10);

    nlohmann::json negative = { {"time", -1}, {"open", 1.0}, {"high", 2.0}, {"low", 0.5}, {"close", 1.5} };
    REQUIRE_THROWS_AS(playback.inject(candleFromJson(negative)), std::invalid_argument);

    Candle last;
    {
        std::shared_lock<std::shared_mutex> lock(playback.getMutex());
        last = playback.getLog().back();
    }
    Candle edge = last;
    edge.time = std::numeric_limits<Timestamp>::max() - 10;
    REQUIRE_THROWS_AS(playback.inject(edge), InvalidCandle);
    REQUIRE(playback.latestFrame()->totalCandles == 10);

    playback.step(5);
    REQUIRE(playback.latestFrame()->totalCandles == 15);
    REQUIRE(playback.getCurrentTick() == 5);
    REQUIRE(playback.latestFrame()->visibleCandles.back().time == last.time + 5000);
}

TEST_CASE("Playback: applyConfig patches hot values", "[playback]") {
    PlaybackController playback;
    configure(playback, 30);

    playback.applyConfig({ {"playback", { {"tickRateMs", 20} }},
                           {"indicators", { {"rsi", { {"enabled", true}, {"period", 5} }} }},
                           {"view", { {"bodyWidth", 0.9} }} });

    REQUIRE(playback.getTickRate() == 20);
    auto frame = playback.latestFrame();
    REQUIRE(frame->indicatorValues.count("RSI") == 1);
    REQUIRE(frame->bodyWidth == Catch::Approx(0.9));

    REQUIRE_THROWS_AS(playback.applyConfig({ {"indicators", { {"ema", { {"period", 0} }} }} }),
        std::invalid_argument);
    REQUIRE(playback.getRuntimeConfig().indicators.ema.period == 14);
}

TEST_CASE("Playback: applyConfig rejects values only a restart can apply", "[playback]") {
    PlaybackController playback;
    configure(playback, 30);

    REQUIRE_THROWS_AS(playback.applyConfig({ {"playback", { {"seedCandles", 50} }} }), std::invalid_argument);
    REQUIRE_THROWS_AS(playback.applyConfig({ {"playback", { {"candleIntervalMs", 60000} }} }), std::invalid_argument);
    REQUIRE_THROWS_AS(playback.applyConfig({ {"playback", { {"startTime", "2025-01-01"} }} }), std::invalid_argument);
    REQUIRE_THROWS_AS(playback.applyConfig({ {"api", { {"port", 9090} }} }), std::invalid_argument);
    REQUIRE(playback.getRuntimeConfig().playback.seedCandles == 30);
    REQUIRE(playback.getRuntimeConfig().api.port == 8080);

    // Echoing the current config back is accepted
    nlohmann::json current = playback.getRuntimeConfig().toJson();
    REQUIRE_NOTHROW(playback.applyConfig(current));
}

TEST_CASE("Playback: view commands are reflected in the runtime config", "[playback]") {
    PlaybackController playback;
    configure(playback, 50);

    playback.dispatch(Command::resizeWindow(20));
    playback.dispatch(Command::simple(CommandType::ZOOM_OUT));
    playback.dispatch(Command::simple(CommandType::SQUEEZE_IN));

    auto view = playback.getRuntimeConfig().toJson()["view"];
    REQUIRE(view["windowSize"] == 20);
    REQUIRE(view["zoomBufferFraction"].get<double>() == Catch::Approx(0.06));
    REQUIRE(view["bodyWidth"].get<double>() == Catch::Approx(0.7));

    playback.dispatch(Command::resizeWindow(2));
    REQUIRE(playback.getRuntimeConfig().view.windowSize == ViewState::MIN_WINDOW);

    playback.applyConfig({ {"view", { {"bodyWidth", 5.0} }} });
    REQUIRE(playback.getRuntimeConfig().view.bodyWidth == Catch::Approx(ViewState::MAX_BODY_WIDTH));
}

TEST_CASE("Playback: state and candle history JSON", "[playback]") {
    PlaybackController playback;
    configure(playback, 12);

    auto state = playback.getStateJson();
    REQUIRE(state["totalCandles"] == 12);
    REQUIRE(state["state"] == "running");
    REQUIRE(state["indicators"]["EMA"]["enabled"] == false);

    auto candles = playback.getCandlesJson(2, 6);
    REQUIRE(candles["candles"].size() == 4);
    REQUIRE_THROWS_AS(playback.getCandlesJson(5, 20), OutOfRange);
}

TEST_CASE("Playback: the playback thread ticks and publishes frames", "[playback]") {
    PlaybackController playback;
    configure(playback, 5);
    playback.setTickRate(5);

    uint64_t before = playback.latestFrame()->sequence;
    playback.start();
    auto frame = playback.waitForFrame(before, std::chrono::milliseconds(2000));
    playback.stop();

    REQUIRE(frame->sequence > before);
    REQUIRE(playback.getCurrentTick() >= 1);
    REQUIRE_FALSE(playback.isRunning());
}

TEST_CASE("Playback: paused sessions do not tick", "[playback]") {
    PlaybackController playback;
    configure(playback, 5);
    playback.setTickRate(2);
    playback.pause();

    playback.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    playback.stop();

    REQUIRE(playback.getCurrentTick() == 0);
    REQUIRE(playback.latestFrame()->totalCandles == 5);
}

TEST_CASE("Playback: stop takes effect without waiting out the tick interval", "[playback]") {
    PlaybackController playback;
    configure(playback, 5);
    playback.setTickRate(10000);

    uint64_t before = playback.latestFrame()->sequence;
    playback.start();
    playback.waitForFrame(before, std::chrono::milliseconds(2000));

    auto t0 = std::chrono::steady_clock::now();
    playback.stop();
    auto elapsed = std::chrono::steady_clock::now() - t0;

    REQUIRE(elapsed < std::chrono::milliseconds(2000));
    REQUIRE(playback.getCurrentTick() == 1);
}

TEST_CASE("Playback: maxTicks stops the session", "[playback]") {
    PlaybackController playback;
    playback.getRuntimeConfig().playback.maxTicks = 3;
    playback.getRuntimeConfig().playback.tickRateMs = 1;
    configure(playback, 0);

    playback.start();
    for (int i = 0; i < 200 && playback.isRunning(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    playback.stop();

    REQUIRE(playback.getCurrentTick() == 3);
    REQUIRE(playback.latestFrame()->totalCandles == 3);
}

TEST_CASE("Playback: start again after maxTicks ended the loop", "[playback]") {
    PlaybackController playback;
    playback.getRuntimeConfig().playback.maxTicks = 3;
    playback.getRuntimeConfig().playback.tickRateMs = 1;
    configure(playback, 0);

    auto waitUntilStopped = [&playback]() {
        for (int i = 0; i < 200 && playback.isRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    playback.start();
    waitUntilStopped();
    REQUIRE(playback.getCurrentTick() == 3);

    playback.applyConfig({ {"playback", { {"maxTicks", 6} }} });
    playback.start();
    waitUntilStopped();
    playback.stop();

    REQUIRE(playback.getCurrentTick() == 6);
    REQUIRE(playback.latestFrame()->totalCandles == 6);
}

TEST_CASE("Playback: frames stay consistent while commands race the ticking thread", "[playback]") {
    PlaybackController playback;
    configure(playback, 20);
    playback.setTickRate(1);
    playback.dispatch(Command::toggleIndicator(IndicatorKind::EMA, true));

    std::atomic<bool> done{ false };
    playback.start();

    std::thread commander([&playback, &done]() {
        for (int i = 0; i < 300; ++i) {
            playback.dispatch(Command::scroll(i % 17));
            playback.dispatch(Command::resizeWindow(5 + i % 25));
            playback.dispatch(Command::toggleIndicator(IndicatorKind::ATR_BANDS, i % 2 == 0));
            if (i % 10 == 0) {
                playback.dispatch(Command::simple(CommandType::FOLLOW_LIVE));
            }
        }
        done = true;
    });

    uint64_t seen = 0;
    int checked = 0;
    bool consistent = true;
    while (!done.load()) {
        auto frame = playback.waitForFrame(seen, std::chrono::milliseconds(100));
        seen = frame->sequence;

        bool ok = frame->windowSize == frame->visibleCandles.size()
            && frame->windowSize <= frame->totalCandles
            && frame->startIndex <= frame->totalCandles - frame->windowSize;
        for (const auto& [name, series] : frame->indicatorValues) {
            ok = ok && series.size() == frame->windowSize;
        }
        consistent = consistent && ok;
        checked++;
    }

    commander.join();
    playback.stop();

    REQUIRE(consistent);
    REQUIRE(checked > 0);
    REQUIRE(playback.getCurrentTick() >= 1);
}
