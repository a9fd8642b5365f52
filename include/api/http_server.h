#pragma once

#include <httplib.h>
#include <thread>
#include <atomic>
#include <string>
#include <functional>

namespace llmgate {

class RequestHandler;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

// HTTP trigger: every request except GET /health becomes one trigger
// envelope for the RequestHandler.
class HttpServer {
public:
    HttpServer(int port, RequestHandler& handler, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    void start();
    void stop();

    void enableCompression(bool enable) { enable_compression_ = enable; }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    bool isRunning() const { return running_; }

private:
    void dispatch(const httplib::Request& req, httplib::Response& res);

    int port_;
    std::string bind_address_;
    RequestHandler& handler_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool enable_compression_{true};
    Logger logger_{};
};

}  // namespace llmgate
