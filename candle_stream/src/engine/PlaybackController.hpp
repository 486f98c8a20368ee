#pragma once

#include "core/CandleLog.hpp"
#include "core/CandleClock.hpp"
#include "core/RuntimeConfig.hpp"
#include "indicators/IndicatorEngine.hpp"
#include "view/ViewState.hpp"
#include "CandleGenerator.hpp"
#include "Command.hpp"
#include "Frame.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <nlohmann/json.hpp>

namespace candle {

    // Drives a chart session: one producer thread appends a synthetic candle
    // per tick, advances the indicators and the view, and publishes a Frame.
    // Every mutation (tick, command, injection, config patch) runs under the
    // same exclusive lock, so readers never observe a half-applied tick.
    class PlaybackController {
    public:
        PlaybackController();
        ~PlaybackController();

        // Load configuration
        void loadConfig(const std::string& configPath);
        void loadConfig(const nlohmann::json& config);

        // Fresh session from RuntimeConfig: clock, generator, indicators,
        // view and seedCandles of history
        void initialize();

        // Merge-patch hot values into the running session.
        // Throws std::invalid_argument (config untouched) on bad indicator params
        // or on a change to a value only initialize() reads.
        void applyConfig(const nlohmann::json& patch);

        // Control
        void start();
        void pause();
        void resume();
        void stop();

        // Step mode: `count` producer steps now, regardless of the paused state
        void step(int count = 1);

        // Append `count` generated candles without counting them as ticks
        void seedHistory(int count);

        // Validated external append through the indicator and view path.
        // Throws InvalidCandle, also for a time with no room for another
        // interval; the session is unchanged in that case.
        Frame inject(const Candle& candle);

        // Apply one UI command and return the resulting frame
        Frame dispatch(const Command& command);

        // Status
        bool isRunning() const { return running_.load(); }
        bool isPaused() const { return paused_.load(); }
        PlaybackState getState() const { return paused_.load() ? PlaybackState::PAUSED : PlaybackState::RUNNING; }
        uint64_t getCurrentTick() const { return currentTick_.load(); }

        void setTickRate(int ms) { tickRateMs_ = ms; }
        int getTickRate() const { return tickRateMs_.load(); }

        RuntimeConfig& getRuntimeConfig() { return rtConfig_; }
        const RuntimeConfig& getRuntimeConfig() const { return rtConfig_; }

        // Thread-safe lock access for API callers
        std::shared_mutex& getMutex() const { return mutex_; }

        // Hold getMutex() while reading these from another thread
        const CandleLog& getLog() const { return log_; }
        const IndicatorEngine& getIndicators() const { return indicators_; }
        const ViewState& getView() const { return view_; }
        const CandleClock& getClock() const { return clock_; }

        // Latest published frame (latest-wins slot, never null)
        std::shared_ptr<const Frame> latestFrame() const;

        // Blocks until a frame newer than `afterSequence` is published or the
        // timeout expires; returns the latest frame either way
        std::shared_ptr<const Frame> waitForFrame(uint64_t afterSequence,
            std::chrono::milliseconds timeout) const;

        // Get state as JSON
        nlohmann::json getStateJson() const;

        // Candles [start, end) plus enabled indicator values; throws OutOfRange
        nlohmann::json getCandlesJson(size_t start, size_t end) const;

    private:
        RuntimeConfig rtConfig_;
        CandleLog log_;
        IndicatorEngine indicators_;
        ViewState view_;
        CandleGenerator generator_;
        CandleClock clock_;
        mutable std::shared_mutex mutex_;   // protects all session state

        std::atomic<bool> running_{ false };
        std::atomic<bool> paused_{ false };
        std::atomic<uint64_t> currentTick_{ 0 };
        std::atomic<int> tickRateMs_{ 500 };
        std::atomic<int> maxTicks_{ 0 };  // 0 = unlimited

        std::thread playbackThread_;

        // Wakes the playback thread early on stop
        std::mutex wakeMutex_;
        std::condition_variable wakeCv_;

        // Latest-wins frame slot
        mutable std::mutex frameMutex_;
        mutable std::condition_variable frameCv_;
        std::shared_ptr<const Frame> latestFrame_;
        uint64_t frameSequence_ = 0;

        void runLoop();

        // All *Locked helpers expect mutex_ held exclusively
        bool tickLocked();
        void appendLocked(const Candle& candle);
        void applyCommandLocked(const Command& command);
        Frame buildFrameLocked() const;
        std::shared_ptr<const Frame> publishLocked();
    };

} // namespace candle
