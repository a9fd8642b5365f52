#include "api/http_server.h"

#include "api/request_handler.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <chrono>
#include <zlib.h>
#include "utils/request_id.h"

namespace llmgate {

namespace {
constexpr const char* kAnyPath = R"(/.*)";

bool accepts_gzip(const httplib::Request& req) {
    if (!req.has_header("Accept-Encoding")) return false;
    auto enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

std::string gzip_compress(const std::string& input) {
    if (input.empty()) return {};

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.reserve(input.size() / 2);
    char buffer[32768];

    int ret = Z_OK;
    while (ret == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(&zs, zs.avail_in ? Z_NO_FLUSH : Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return {};
        }
        const size_t written = sizeof(buffer) - zs.avail_out;
        if (written > 0) {
            output.append(buffer, written);
        }
    }

    deflateEnd(&zs);
    return output;
}

void write_envelope(const ResponseEnvelope& envelope, httplib::Response& res) {
    res.status = envelope.status_code;
    std::string content_type = "application/json";
    for (const auto& [name, value] : envelope.headers) {
        if (name == "Content-Type") {
            content_type = value;
            continue;
        }
        res.set_header(name, value);
    }
    res.set_content(envelope.body, content_type);
}
}  // namespace

HttpServer::HttpServer(int port, RequestHandler& handler, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), handler_(handler) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::dispatch(const httplib::Request& req, httplib::Response& res) {
    InboundRequest inbound;
    inbound.http_method = req.method;
    if (!req.body.empty()) inbound.body = req.body;

    ExecutionContext context;
    context.request_id = res.get_header_value("X-Request-Id");

    write_envelope(handler_.handle(inbound, context), res);
}

void HttpServer::start() {
    if (running_) return;

    server_.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        // Request ID
        std::string req_id = req.get_header_value("X-Request-Id");
        if (req_id.empty()) req_id = generate_request_id();
        res.set_header("X-Request-Id", req_id);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Post-routing handler to ensure CORS headers on all responses
    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        for (const auto& [name, value] : defaultResponseHeaders()) {
            if (name == "Content-Type") continue;
            if (!res.has_header(name)) res.set_header(name, value);
        }
        if (!enable_compression_) return;
        if (!accepts_gzip(req)) return;
        if (res.body.empty()) return;
        if (res.has_header("Content-Encoding")) return;

        auto compressed = gzip_compress(res.body);
        if (compressed.empty()) return;

        const auto content_type = res.get_header_value("Content-Type");
        res.set_content(compressed,
                        content_type.empty() ? "application/octet-stream" : content_type);
        auto range = res.headers.equal_range("Content-Length");
        res.headers.erase(range.first, range.second);
        res.set_header("Content-Length", std::to_string(compressed.size()));
        res.set_header("Content-Encoding", "gzip");
        res.set_header("Vary", "Accept-Encoding");
    });

    // Access log
    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
        }
        spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, what);
        write_envelope(createResponse(500, {
            {"success", false},
            {"error", {{"code", kInternalServerErrorCode}, {"message", kGenericErrorMessage}}}
        }), res);
    });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {{"status", "ok"}};
        res.set_content(body.dump(), "application/json");
    });

    auto route = [this](const httplib::Request& req, httplib::Response& res) { dispatch(req, res); };
    server_.Post(kAnyPath, route);
    server_.Get(kAnyPath, route);
    server_.Put(kAnyPath, route);
    server_.Patch(kAnyPath, route);
    server_.Delete(kAnyPath, route);
    server_.Options(kAnyPath, route);

    if (!server_.bind_to_port(bind_address_, port_)) {
        throw std::runtime_error("failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::info("Listening on {}:{}", bind_address_, port_);
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace llmgate
