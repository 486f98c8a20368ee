#include "PlaybackController.hpp"
#include "core/Errors.hpp"
#include "view/RangeCalculator.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <string>

namespace candle {

    namespace {
        constexpr IndicatorKind ALL_KINDS[] = {
            IndicatorKind::EMA, IndicatorKind::RSI,
            IndicatorKind::SUPERTREND, IndicatorKind::ATR_BANDS
        };

        void validateIndicators(const RuntimeConfig::IndicatorSet& set) {
            for (auto kind : ALL_KINDS) {
                Indicator::validateParams(set.get(kind).params());
            }
        }

        // Values read only by initialize() or main(); a running session
        // cannot pick them up
        void rejectRestartOnlyChanges(const RuntimeConfig& current, const RuntimeConfig& patched) {
            auto reject = [](const char* key) {
                throw std::invalid_argument(std::string(key) + " cannot change on a running session");
            };
            if (patched.playback.seedCandles != current.playback.seedCandles) reject("playback.seedCandles");
            if (patched.playback.candleIntervalMs != current.playback.candleIntervalMs) reject("playback.candleIntervalMs");
            if (patched.playback.startTime != current.playback.startTime) reject("playback.startTime");
            if (patched.logging.file != current.logging.file) reject("logging.file");
            if (patched.logging.console != current.logging.console) reject("logging.console");
            if (patched.api.host != current.api.host) reject("api.host");
            if (patched.api.port != current.api.port) reject("api.port");
        }
    }

    PlaybackController::PlaybackController()
        : latestFrame_(std::make_shared<const Frame>())
    {
    }

    PlaybackController::~PlaybackController() {
        stop();
    }

    void PlaybackController::loadConfig(const std::string& configPath) {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", configPath);
            return;
        }

        try {
            loadConfig(nlohmann::json::parse(file));
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse config: {}", e.what());
        }
    }

    void PlaybackController::loadConfig(const nlohmann::json& config) {
        RuntimeConfig patched = rtConfig_;
        patched.fromJson(config);
        validateIndicators(patched.indicators);
        rtConfig_ = patched;

        tickRateMs_ = rtConfig_.playback.tickRateMs;
        maxTicks_ = rtConfig_.playback.maxTicks;

        if (config.contains("logging")) {
            Logger::init(rtConfig_.logging.file, rtConfig_.logging.level, rtConfig_.logging.console);
        }

        Logger::info("Configuration loaded");
    }

    void PlaybackController::initialize() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Logger::info("Initializing playback session...");

        tickRateMs_ = rtConfig_.playback.tickRateMs;
        maxTicks_ = rtConfig_.playback.maxTicks;
        currentTick_ = 0;

        log_ = CandleLog();
        generator_.setParams(rtConfig_.generator);
        generator_.reseed(rtConfig_.generator.seed);
        clock_.initialize(rtConfig_.playback.startTime, rtConfig_.playback.candleIntervalMs);

        // History ends at "now" when no explicit start time is given
        int seedCount = std::max(0, rtConfig_.playback.seedCandles);
        if (rtConfig_.playback.startTime.empty() && seedCount > 0) {
            clock_.rewind(static_cast<uint64_t>(seedCount));
        }

        indicators_ = IndicatorEngine();
        indicators_.configure(rtConfig_.indicators, log_);

        view_ = ViewState(rtConfig_.view.windowSize,
            rtConfig_.view.zoomBufferFraction,
            rtConfig_.view.bodyWidth);

        log_.reserve(static_cast<size_t>(seedCount) + 1024);
        for (int i = 0; i < seedCount; ++i) {
            appendLocked(generator_.next(log_, clock_));
        }

        publishLocked();

        Logger::info("Session initialized with {} seed candles (start: {}, interval: {}ms)",
            log_.size(), CandleClock::formatDateTime(clock_.getStartTime()), clock_.getIntervalMs());
    }

    void PlaybackController::applyConfig(const nlohmann::json& patch) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        RuntimeConfig patched = rtConfig_;
        patched.fromJson(patch);
        validateIndicators(patched.indicators);
        rejectRestartOnlyChanges(rtConfig_, patched);
        rtConfig_ = patched;

        if (patch.contains("playback")) {
            tickRateMs_ = rtConfig_.playback.tickRateMs;
            maxTicks_ = rtConfig_.playback.maxTicks;
        }

        if (patch.contains("generator")) {
            generator_.setParams(rtConfig_.generator);
        }

        if (patch.contains("indicators")) {
            indicators_.configure(rtConfig_.indicators, log_);
        }

        if (patch.contains("view")) {
            const auto& v = patch["view"];
            if (v.contains("windowSize")) view_.resizeWindow(rtConfig_.view.windowSize, log_.size());
            if (v.contains("zoomBufferFraction")) view_.setZoomBufferFraction(rtConfig_.view.zoomBufferFraction);
            if (v.contains("bodyWidth")) view_.setBodyWidth(rtConfig_.view.bodyWidth);

            // Report the clamped values
            rtConfig_.view.windowSize = view_.getRequestedWindow();
            rtConfig_.view.zoomBufferFraction = view_.getZoomBufferFraction();
            rtConfig_.view.bodyWidth = view_.getBodyWidth();
        }

        if (patch.contains("logging") && patch["logging"].contains("level")) {
            Logger::get()->set_level(Logger::parseLevel(rtConfig_.logging.level));
        }

        publishLocked();
        Logger::info("Config updated (hot reload)");
    }

    void PlaybackController::start() {
        if (running_.load()) {
            Logger::warn("Playback already running");
            return;
        }

        // A loop that ended on maxTicks leaves its thread joinable
        if (playbackThread_.joinable()) {
            playbackThread_.join();
        }

        running_ = true;
        playbackThread_ = std::thread(&PlaybackController::runLoop, this);

        Logger::info("Playback started (tick rate: {}ms, state: {})",
            tickRateMs_.load(), playbackStateToString(getState()));
    }

    void PlaybackController::pause() {
        dispatch(Command::pause());
    }

    void PlaybackController::resume() {
        dispatch(Command::resume());
    }

    void PlaybackController::stop() {
        {
            std::lock_guard<std::mutex> lk(wakeMutex_);
            if (!running_.load() && !playbackThread_.joinable()) return;
            running_ = false;
        }
        wakeCv_.notify_all();

        if (playbackThread_.joinable()) {
            playbackThread_.join();
        }

        Logger::info("Playback stopped at tick {}", currentTick_.load());
    }

    void PlaybackController::step(int count) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (int i = 0; i < count; ++i) {
            tickLocked();
        }
        publishLocked();
    }

    void PlaybackController::seedHistory(int count) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (int i = 0; i < count; ++i) {
            appendLocked(generator_.next(log_, clock_));
        }
        publishLocked();
    }

    Frame PlaybackController::inject(const Candle& candle) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        try {
            // The generator continues from the injected time, so it must
            // leave room for at least one more interval
            if (!clock_.hasRoomForTick(candle.time)) {
                throw InvalidCandle("Candle time " + std::to_string(candle.time) +
                    " leaves no room for the next interval");
            }
            appendLocked(candle);
        }
        catch (const InvalidCandle& e) {
            Logger::warn("Rejected injected candle: {}", e.what());
            throw;
        }
        clock_.syncTo(candle.time);
        return *publishLocked();
    }

    Frame PlaybackController::dispatch(const Command& command) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        applyCommandLocked(command);
        return *publishLocked();
    }

    void PlaybackController::applyCommandLocked(const Command& command) {
        size_t count = log_.size();

        switch (command.type) {
        case CommandType::PAUSE:
            if (!paused_.exchange(true)) {
                Logger::info("Playback paused at tick {}", currentTick_.load());
            }
            break;
        case CommandType::RESUME:
            if (paused_.exchange(false)) {
                Logger::info("Playback resumed");
            }
            break;
        case CommandType::SCROLL:
            view_.scroll(command.position, count);
            break;
        case CommandType::ZOOM_IN:
            view_.zoomIn();
            break;
        case CommandType::ZOOM_OUT:
            view_.zoomOut();
            break;
        case CommandType::RESIZE_WINDOW:
            view_.resizeWindow(command.size, count);
            break;
        case CommandType::NARROW_WINDOW:
            view_.narrowWindow(count);
            break;
        case CommandType::WIDEN_WINDOW:
            view_.widenWindow(count);
            break;
        case CommandType::SQUEEZE_IN:
            view_.squeezeIn();
            break;
        case CommandType::SQUEEZE_OUT:
            view_.squeezeOut();
            break;
        case CommandType::FOLLOW_LIVE:
            view_.followLive(count);
            break;
        case CommandType::TOGGLE_INDICATOR:
            indicators_.setEnabled(command.indicator, command.enabled, log_);
            rtConfig_.indicators.get(command.indicator).enabled = command.enabled;
            break;
        case CommandType::SET_INDICATOR_PARAMS: {
            indicators_.setParams(command.indicator, command.params, log_);
            auto& toggle = rtConfig_.indicators.get(command.indicator);
            toggle.period = command.params.period;
            toggle.multiplier = command.params.multiplier;
            break;
        }
        }

        // Keep GET /config in step with the view the commands produced
        rtConfig_.view.windowSize = view_.getRequestedWindow();
        rtConfig_.view.zoomBufferFraction = view_.getZoomBufferFraction();
        rtConfig_.view.bodyWidth = view_.getBodyWidth();

        Logger::debug("Command applied: {}", commandTypeToString(command.type));
    }

    void PlaybackController::runLoop() {
        while (running_.load()) {
            {
                std::unique_lock<std::shared_mutex> lock(mutex_);
                // Re-checked under the lock so a pause wins over a pending tick
                if (!paused_.load()) {
                    tickLocked();
                    publishLocked();
                }
            }

            if (maxTicks_.load() > 0 && currentTick_.load() >= static_cast<uint64_t>(maxTicks_.load())) {
                Logger::info("Reached max ticks ({}), stopping", maxTicks_.load());
                running_ = false;
                break;
            }

            std::unique_lock<std::mutex> lk(wakeMutex_);
            wakeCv_.wait_for(lk, std::chrono::milliseconds(tickRateMs_.load()),
                [this] { return !running_.load(); });
        }
    }

    bool PlaybackController::tickLocked() {
        try {
            appendLocked(generator_.next(log_, clock_));
        }
        catch (const std::exception& e) {
            Logger::warn("Tick {} dropped: {}", currentTick_.load(), e.what());
            return false;
        }

        currentTick_++;
        Logger::debug("Tick {}: {} candles, close {:.4f}",
            currentTick_.load(), log_.size(), log_.back().close);
        return true;
    }

    void PlaybackController::appendLocked(const Candle& candle) {
        size_t oldCount = log_.size();
        log_.append(candle);
        indicators_.update(log_);
        view_.onAppend(oldCount, log_.size());
    }

    Frame PlaybackController::buildFrameLocked() const {
        Frame frame;
        frame.state = getState();
        frame.totalCandles = log_.size();
        frame.zoomBufferFraction = view_.getZoomBufferFraction();
        frame.bodyWidth = view_.getBodyWidth();

        auto [start, end] = view_.visibleRange(log_.size());
        frame.startIndex = start;
        frame.windowSize = end - start;

        CandleSlice slice = log_.slice(start, end);
        frame.visibleCandles.assign(slice.begin(), slice.end());
        frame.indicatorValues = indicators_.sliceOutputs(start, end);

        if (!slice.empty()) {
            frame.ranges = RangeCalculator::compute(slice, view_.getZoomBufferFraction());
        }
        return frame;
    }

    std::shared_ptr<const Frame> PlaybackController::publishLocked() {
        auto frame = std::make_shared<Frame>(buildFrameLocked());
        {
            std::lock_guard<std::mutex> lk(frameMutex_);
            frame->sequence = ++frameSequence_;
            latestFrame_ = frame;
        }
        frameCv_.notify_all();
        return frame;
    }

    std::shared_ptr<const Frame> PlaybackController::latestFrame() const {
        std::lock_guard<std::mutex> lk(frameMutex_);
        return latestFrame_;
    }

    std::shared_ptr<const Frame> PlaybackController::waitForFrame(uint64_t afterSequence,
        std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lk(frameMutex_);
        frameCv_.wait_for(lk, timeout, [&] { return frameSequence_ > afterSequence; });
        return latestFrame_;
    }

    nlohmann::json PlaybackController::getStateJson() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        nlohmann::json state;
        state["tick"] = currentTick_.load();
        state["running"] = running_.load();
        state["paused"] = paused_.load();
        state["state"] = playbackStateToString(getState());
        state["tickRateMs"] = tickRateMs_.load();
        state["totalCandles"] = log_.size();
        state["currentTime"] = CandleClock::formatDateTime(clock_.getCurrentTime());
        state["intervalMs"] = clock_.getIntervalMs();

        auto [start, end] = view_.visibleRange(log_.size());
        state["view"] = {
            {"startIndex", start},
            {"windowSize", end - start},
            {"requestedWindow", view_.getRequestedWindow()},
            {"followingLive", view_.isAtLiveEdge(log_.size())},
            {"zoomBufferFraction", view_.getZoomBufferFraction()},
            {"bodyWidth", view_.getBodyWidth()}
        };

        nlohmann::json indicators = nlohmann::json::object();
        for (auto kind : ALL_KINDS) {
            const auto& ind = indicators_.get(kind);
            indicators[ind.getName()] = {
                {"enabled", indicators_.isEnabled(kind)},
                {"period", ind.getParams().period},
                {"multiplier", ind.getParams().multiplier},
                {"processed", ind.getProcessedCount()}
            };
        }
        state["indicators"] = indicators;

        return state;
    }

    nlohmann::json PlaybackController::getCandlesJson(size_t start, size_t end) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        CandleSlice slice = log_.slice(start, end);

        nlohmann::json j;
        j["start"] = start;
        j["end"] = end;
        j["totalCandles"] = log_.size();

        nlohmann::json candles = nlohmann::json::array();
        for (const auto& c : slice) {
            candles.push_back(candleToJson(c));
        }
        j["candles"] = candles;

        nlohmann::json indicators = nlohmann::json::object();
        for (const auto& [name, series] : indicators_.sliceOutputs(start, end)) {
            indicators[name] = seriesToJson(series);
        }
        j["indicatorValues"] = indicators;
        return j;
    }

} // namespace candle
