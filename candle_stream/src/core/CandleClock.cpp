#include "CandleClock.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>

namespace candle {

    CandleClock::CandleClock() {}

    void CandleClock::initialize(Timestamp startMs, Timestamp intervalMs) {
        if (intervalMs == 0) {
            throw std::invalid_argument("Candle interval must be positive");
        }
        intervalMs_ = intervalMs;
        startMs_ = startMs;
        currentMs_ = startMs;
        totalTicks_ = 0;
    }

    void CandleClock::initialize(const std::string& startDateTime, Timestamp intervalMs) {
        Timestamp start = startDateTime.empty() ? now() : parseDateTime(startDateTime);
        initialize(start, intervalMs);
    }

    Timestamp CandleClock::tick() {
        if (!hasRoomForTick(currentMs_)) {
            throw std::overflow_error("Candle clock cannot advance past " + std::to_string(currentMs_));
        }
        totalTicks_++;
        currentMs_ += intervalMs_;
        return currentMs_;
    }

    bool CandleClock::hasRoomForTick(Timestamp ms) const {
        return ms <= std::numeric_limits<Timestamp>::max() - intervalMs_;
    }

    void CandleClock::rewind(uint64_t count) {
        Timestamp span = count * intervalMs_;
        startMs_ = currentMs_ > span ? currentMs_ - span : 0;
        currentMs_ = startMs_;
    }

    Timestamp CandleClock::parseDateTime(const std::string& text) {
        std::tm tm = {};
        std::istringstream ss(text);
        if (text.size() > 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        }
        else {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse date/time: " + text);
        }

#ifdef _WIN32
        time_t t = _mkgmtime(&tm);
#else
        time_t t = timegm(&tm);
#endif

        return static_cast<Timestamp>(t) * 1000;
    }

    std::string CandleClock::formatDateTime(Timestamp ms) {
        time_t t = static_cast<time_t>(ms / 1000);
        std::tm tm;
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::string CandleClock::formatTime(Timestamp ms) {
        time_t t = static_cast<time_t>(ms / 1000);
        std::tm tm;
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif

        std::ostringstream ss;
        ss << std::put_time(&tm, "%H:%M:%S");
        return ss.str();
    }

} // namespace candle
