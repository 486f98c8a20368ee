#pragma once

#include <csignal>

namespace candle {

    // SIGINT/SIGTERM only raise a flag; the main loop polls it and performs
    // the actual shutdown outside signal context.
    class ShutdownSignal {
    public:
        static void install() {
            std::signal(SIGINT, handle);
            std::signal(SIGTERM, handle);
        }

        static bool requested() { return flag_ != 0; }

        static void reset() { flag_ = 0; }

    private:
        static void handle(int) { flag_ = 1; }

        static inline volatile std::sig_atomic_t flag_ = 0;
    };

} // namespace candle
