#pragma once

#include <stdexcept>
#include <string>

namespace candle {

    // Append rejected: OHLC ordering or strictly increasing time violated.
    // Fatal to that append only; the log is left unchanged.
    class InvalidCandle : public std::invalid_argument {
    public:
        explicit InvalidCandle(const std::string& what) : std::invalid_argument(what) {}
    };

    // Slice indices outside [0, length] or start > end
    class OutOfRange : public std::out_of_range {
    public:
        explicit OutOfRange(const std::string& what) : std::out_of_range(what) {}
    };

    // Range derivation over a slice with zero candles
    class EmptyWindow : public std::runtime_error {
    public:
        explicit EmptyWindow(const std::string& what) : std::runtime_error(what) {}
    };

} // namespace candle
