#include "ApiServer.hpp"
#include "core/Errors.hpp"
#include "core/RuntimeConfig.hpp"
#include "utils/Logger.hpp"
#include <nlohmann/json.hpp>
#include <shared_mutex>

namespace candle {

    ApiServer::ApiServer(PlaybackController& playback, const std::string& host, int port)
        : playback_(playback)
        , host_(host)
        , port_(port)
    {
        // SSE streams each hold a worker for their lifetime
        server_.new_task_queue = [] { return new httplib::ThreadPool(16); };

        server_.set_read_timeout(30, 0);
        server_.set_write_timeout(30, 0);
        server_.set_keep_alive_timeout(10);

        setupRoutes();
    }

    ApiServer::~ApiServer() {
        stop();
    }

    void ApiServer::start() {
        if (running_.load()) return;

        running_ = true;

        serverThread_ = std::thread([this]() {
            Logger::info("API server starting on {}:{}", host_, port_);
            if (!server_.listen(host_.c_str(), port_)) {
                Logger::error("API server failed to listen on {}:{}", host_, port_);
                running_ = false;
            }
            });

        // Give server time to start
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void ApiServer::stop() {
        bool wasRunning = running_.exchange(false);
        server_.stop();

        // Joined even after a failed listen cleared running_
        if (serverThread_.joinable()) {
            serverThread_.join();
        }

        if (wasRunning) {
            Logger::info("API server stopped");
        }
    }

    std::string ApiServer::jsonResponse(const nlohmann::json& j) {
        return j.dump();
    }

    std::string ApiServer::errorResponse(const std::string& message) {
        return nlohmann::json{ {"error", message} }.dump();
    }

    template<typename Handler>
    void ApiServer::guarded(httplib::Response& res, Handler&& handler) {
        try {
            handler();
        }
        catch (const EmptyWindow& e) {
            res.status = 409;
            res.set_content(errorResponse(e.what()), "application/json");
        }
        catch (const nlohmann::json::exception& e) {
            res.status = 400;
            res.set_content(errorResponse(e.what()), "application/json");
        }
        catch (const std::invalid_argument& e) {
            // InvalidCandle, bad indicator params, unknown names
            res.status = 400;
            res.set_content(errorResponse(e.what()), "application/json");
        }
        catch (const std::out_of_range& e) {
            // OutOfRange
            res.status = 400;
            res.set_content(errorResponse(e.what()), "application/json");
        }
    }

    void ApiServer::setupRoutes() {
        // CORS headers
        server_.set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
            {"Access-Control-Allow-Headers", "Content-Type"}
            });

        // OPTIONS handler for CORS preflight
        server_.Options(".*", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            });

        // GET /state - Playback state, view and indicator toggles
        server_.Get("/state", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(jsonResponse(playback_.getStateJson()), "application/json");
            });

        // GET /frame - Latest published frame
        server_.Get("/frame", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(jsonResponse(playback_.latestFrame()->toJson()), "application/json");
            });

        // GET /candles?start=&end= - History slice; defaults to the whole log
        server_.Get("/candles", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&]() {
                size_t total = 0;
                {
                    std::shared_lock<std::shared_mutex> lock(playback_.getMutex());
                    total = playback_.getLog().size();
                }
                size_t start = req.has_param("start") ? std::stoul(req.get_param_value("start")) : 0;
                size_t end = req.has_param("end") ? std::stoul(req.get_param_value("end")) : total;
                res.set_content(jsonResponse(playback_.getCandlesJson(start, end)), "application/json");
                });
            });

        // POST /candles - Inject one validated candle
        server_.Post("/candles", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&]() {
                auto body = nlohmann::json::parse(req.body);
                Frame frame = playback_.inject(candleFromJson(body));
                res.set_content(jsonResponse(frame.toJson()), "application/json");
                });
            });

        // POST /command - {"type": "...", ...} -> resulting frame
        server_.Post("/command", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&]() {
                auto body = nlohmann::json::parse(req.body);
                Command command = Command::fromJson(body);
                Frame frame = playback_.dispatch(command);
                res.set_content(jsonResponse(frame.toJson()), "application/json");
                });
            });

        // POST /pause, /resume - Convenience routes
        server_.Post("/pause", [this](const httplib::Request&, httplib::Response& res) {
            playback_.pause();
            res.set_content(jsonResponse(playback_.getStateJson()), "application/json");
            });

        server_.Post("/resume", [this](const httplib::Request&, httplib::Response& res) {
            playback_.resume();
            res.set_content(jsonResponse(playback_.getStateJson()), "application/json");
            });

        // POST /step - {"count": n}
        server_.Post("/step", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&]() {
                int count = 1;
                if (!req.body.empty()) {
                    count = nlohmann::json::parse(req.body).value("count", 1);
                }
                if (count < 1) {
                    throw std::invalid_argument("count must be >= 1");
                }
                playback_.step(count);
                res.set_content(jsonResponse(playback_.latestFrame()->toJson()), "application/json");
                });
            });

        // GET /config - Return full RuntimeConfig as JSON
        server_.Get("/config", [this](const httplib::Request&, httplib::Response& res) {
            std::shared_lock<std::shared_mutex> lock(playback_.getMutex());
            res.set_content(jsonResponse(playback_.getRuntimeConfig().toJson()), "application/json");
            });

        // GET /config/defaults - Return a fresh default RuntimeConfig
        server_.Get("/config/defaults", [](const httplib::Request&, httplib::Response& res) {
            RuntimeConfig defaults;
            res.set_content(jsonResponse(defaults.toJson()), "application/json");
            });

        // POST /config - Merge-patch update to RuntimeConfig (hot params only)
        server_.Post("/config", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&]() {
                auto body = nlohmann::json::parse(req.body);
                playback_.applyConfig(body);
                res.set_content(jsonResponse({
                    {"status", "ok"},
                    {"message", "Config updated (hot reload)"}
                    }), "application/json");
                });
            });

        // GET /stream - Server-Sent Events, latest frame wins
        server_.Get("/stream", [this](const httplib::Request&, httplib::Response& res) {
            res.set_header("Cache-Control", "no-cache");
            res.set_header("Connection", "keep-alive");
            res.set_header("Access-Control-Allow-Origin", "*");

            res.set_chunked_content_provider(
                "text/event-stream",
                [this](size_t /*offset*/, httplib::DataSink& sink) {
                    uint64_t lastSequence = 0;
                    while (running_.load()) {
                        auto frame = playback_.waitForFrame(lastSequence, std::chrono::milliseconds(1000));
                        if (frame->sequence <= lastSequence) {
                            continue;  // timeout, nothing new
                        }
                        lastSequence = frame->sequence;

                        std::string event = "data: " + frame->toJson().dump() + "\n\n";
                        if (!sink.write(event.c_str(), event.size())) {
                            return false;  // Connection closed
                        }
                    }
                    return false;
                }
            );
            });
    }

} // namespace candle
