#pragma once

#include "engine/PlaybackController.hpp"
#include <httplib.h>
#include <thread>
#include <atomic>

namespace candle {

class ApiServer {
public:
    ApiServer(PlaybackController& playback, const std::string& host = "0.0.0.0", int port = 8080);
    ~ApiServer();

    void start();
    void stop();

    bool isRunning() const { return running_.load(); }

private:
    PlaybackController& playback_;
    httplib::Server server_;
    std::string host_;
    int port_;

    std::thread serverThread_;
    std::atomic<bool> running_{false};

    void setupRoutes();

    // Helper for JSON responses
    static std::string jsonResponse(const nlohmann::json& j);
    static std::string errorResponse(const std::string& message);

    // Runs `handler`, mapping InvalidCandle / OutOfRange / parse errors to 400
    // and EmptyWindow to 409
    template<typename Handler>
    static void guarded(httplib::Response& res, Handler&& handler);
};

} // namespace candle
