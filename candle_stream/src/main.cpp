#include "engine/PlaybackController.hpp"
#include "api/ApiServer.hpp"
#include "utils/Logger.hpp"
#include "utils/ShutdownSignal.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

using namespace candle;

int main(int argc, char* argv[]) {
    ShutdownSignal::install();

    std::string configPath;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<unsigned int> seed;
    bool startPaused = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--host" && i + 1 < argc) {
                host = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc) {
                port = std::stoi(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            }
            else if (arg == "--paused") {
                startPaused = true;
            }
            else if (arg == "--help") {
                std::cout << "Streaming OHLC Candle Engine\n"
                    << "Usage: candle_stream [options]\n"
                    << "Options:\n"
                    << "  --config <path>         Path to JSON config file (default: built-in defaults)\n"
                    << "  --host <host>           API server host (default: 0.0.0.0)\n"
                    << "  --port <port>           API server port (default: 8080)\n"
                    << "  --seed <n>              Generator seed for a reproducible session\n"
                    << "  --paused                Start with playback paused\n"
                    << "  --help                  Show this help\n";
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (see --help)\n";
                return 2;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 2;
    }

    try {
        Logger::init("candle_stream.log", "info", true);

        PlaybackController playback;

        if (!configPath.empty()) {
            playback.loadConfig(configPath);
        }

        auto& cfg = playback.getRuntimeConfig();
        if (host) cfg.api.host = *host;
        if (port) cfg.api.port = *port;
        if (seed) cfg.generator.seed = *seed;

        Logger::info("=== Streaming OHLC Candle Engine ===");
        Logger::info("Config: {}", configPath.empty() ? "<defaults>" : configPath);
        Logger::info("API: {}:{}", cfg.api.host, cfg.api.port);

        playback.initialize();
        if (startPaused) {
            playback.pause();
        }

        ApiServer api(playback, cfg.api.host, cfg.api.port);

        api.start();
        playback.start();

        Logger::info("Ready. API available at http://{}:{}", cfg.api.host, cfg.api.port);
        Logger::info("Press Ctrl+C to exit");

        while (api.isRunning() && !ShutdownSignal::requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (ShutdownSignal::requested()) {
            Logger::info("Shutdown requested, stopping...");
        }
        playback.stop();
        api.stop();
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Shutdown complete");
    return 0;
}
