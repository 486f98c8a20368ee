#include "CandleLog.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace candle {

    void CandleLog::validate(const Candle& c) const {
        if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
            !std::isfinite(c.low) || !std::isfinite(c.close)) {
            throw InvalidCandle("Candle prices must be finite");
        }

        if (c.high < std::max(c.open, c.close)) {
            throw InvalidCandle("Candle high " + std::to_string(c.high) +
                " is below max(open, close)");
        }

        if (c.low > std::min(c.open, c.close)) {
            throw InvalidCandle("Candle low " + std::to_string(c.low) +
                " is above min(open, close)");
        }

        if (c.volume && *c.volume < 0) {
            throw InvalidCandle("Candle volume must be non-negative");
        }

        if (!candles_.empty() && c.time <= candles_.back().time) {
            throw InvalidCandle("Candle time " + std::to_string(c.time) +
                " does not follow previous time " + std::to_string(candles_.back().time));
        }
    }

    size_t CandleLog::append(const Candle& candle) {
        validate(candle);
        candles_.push_back(candle);
        return candles_.size() - 1;
    }

    CandleSlice CandleLog::slice(size_t start, size_t end) const {
        if (start > end || end > candles_.size()) {
            throw OutOfRange("Slice [" + std::to_string(start) + ", " + std::to_string(end) +
                ") outside log of length " + std::to_string(candles_.size()));
        }
        if (start == end) {
            return CandleSlice(nullptr, 0, start);
        }
        return CandleSlice(candles_.data() + start, end - start, start);
    }

    const Candle& CandleLog::at(size_t index) const {
        if (index >= candles_.size()) {
            throw OutOfRange("Candle index " + std::to_string(index) +
                " outside log of length " + std::to_string(candles_.size()));
        }
        return candles_[index];
    }

    const Candle& CandleLog::back() const {
        if (candles_.empty()) {
            throw OutOfRange("Candle log is empty");
        }
        return candles_.back();
    }

} // namespace candle
