#pragma once

#include <cstdint>
#include <string>
#include "Types.hpp"

namespace candle {

    // Hands out candle open times on a fixed interval.
    // One real tick produces one candle regardless of the tick cadence.
    class CandleClock {
    public:
        CandleClock();

        // Start at an explicit epoch-ms time
        void initialize(Timestamp startMs, Timestamp intervalMs = 1000);

        // Start at "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DD" (UTC); empty = now
        void initialize(const std::string& startDateTime, Timestamp intervalMs = 1000);

        // Advance by one interval, returns the new time.
        // Throws std::overflow_error instead of wrapping past the epoch range.
        Timestamp tick();

        // True when one more interval fits after `ms`
        bool hasRoomForTick(Timestamp ms) const;

        // Re-anchor after a candle was appended from outside the clock
        void syncTo(Timestamp ms) { currentMs_ = ms; }

        // Move the start back so that `count` candles end at the current time
        void rewind(uint64_t count);

        Timestamp getCurrentTime() const { return currentMs_; }
        Timestamp getStartTime() const { return startMs_; }
        Timestamp getIntervalMs() const { return intervalMs_; }
        uint64_t getTotalTicks() const { return totalTicks_; }

        // Parse "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DD" (UTC) to epoch ms
        static Timestamp parseDateTime(const std::string& text);

        // Format epoch ms as "YYYY-MM-DDTHH:MM:SSZ"
        static std::string formatDateTime(Timestamp ms);

        // Format epoch ms as "HH:MM:SS" (the chart axis label)
        static std::string formatTime(Timestamp ms);

    private:
        Timestamp startMs_ = 0;
        Timestamp currentMs_ = 0;
        Timestamp intervalMs_ = 1000;
        uint64_t totalTicks_ = 0;
    };

} // namespace candle
