#pragma once

#include "Types.hpp"
#include <vector>
#include <cstddef>

namespace candle {

    // Read-only view over a contiguous run of candles owned by a CandleLog.
    // Invalidated by the next append.
    class CandleSlice {
    public:
        CandleSlice() = default;
        CandleSlice(const Candle* first, size_t count, size_t offset)
            : first_(first), count_(count), offset_(offset) {}

        const Candle* begin() const { return first_; }
        const Candle* end() const { return first_ + count_; }
        const Candle& operator[](size_t i) const { return first_[i]; }
        const Candle& front() const { return first_[0]; }
        const Candle& back() const { return first_[count_ - 1]; }

        size_t size() const { return count_; }
        bool empty() const { return count_ == 0; }

        // Index of the first candle in the owning log
        size_t offset() const { return offset_; }

    private:
        const Candle* first_ = nullptr;
        size_t count_ = 0;
        size_t offset_ = 0;
    };

    // Append-only, ordered candle history. Candles are never mutated or
    // removed once appended; display trimming belongs to ViewState.
    class CandleLog {
    public:
        CandleLog() = default;

        // Validates and appends; returns the new candle's index.
        // Throws InvalidCandle if high/low do not bound open/close, a price is
        // not finite, volume is negative, or time does not strictly increase.
        size_t append(const Candle& candle);

        // Throws OutOfRange unless 0 <= start <= end <= size()
        CandleSlice slice(size_t start, size_t end) const;

        const Candle& at(size_t index) const;
        const Candle& back() const;

        size_t size() const { return candles_.size(); }
        bool empty() const { return candles_.empty(); }

        void reserve(size_t n) { candles_.reserve(n); }

        // Same checks as append, without mutating the log
        void validate(const Candle& candle) const;

    private:
        std::vector<Candle> candles_;
    };

} // namespace candle
