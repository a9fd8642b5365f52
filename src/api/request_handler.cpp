#include "api/request_handler.h"

#include <chrono>
#include <cmath>
#include <spdlog/spdlog.h>

#include "core/model_invoker.h"
#include "core/request_validator.h"
#include "utils/json_utils.h"

namespace llmgate {

using json = nlohmann::json;

namespace {

int64_t unixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

json requestIdJson(const ExecutionContext& context) {
    if (context.request_id) return *context.request_id;
    return nullptr;
}

json metadata(double elapsed_ms, const ExecutionContext& context) {
    return json{
        {"execution_time_ms", roundMillis(elapsed_ms)},
        {"timestamp", unixSeconds()},
        {"request_id", requestIdJson(context)}
    };
}

}  // namespace

json ResponseEnvelope::toJson() const {
    return json{
        {"statusCode", status_code},
        {"headers", headers},
        {"body", body}
    };
}

const HeaderMap& defaultResponseHeaders() {
    static const HeaderMap headers = {
        {"Content-Type", "application/json"},
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Headers", "Content-Type,X-Amz-Date,Authorization,X-Api-Key,X-Amz-Security-Token"},
        {"Access-Control-Allow-Methods", "GET,POST,OPTIONS"},
    };
    return headers;
}

ResponseEnvelope createResponse(int status_code, const json& body, const HeaderMap& extra_headers) {
    ResponseEnvelope envelope;
    envelope.status_code = status_code;
    envelope.headers = defaultResponseHeaders();
    for (const auto& [name, value] : extra_headers) {
        envelope.headers[name] = value;
    }
    envelope.body = json_to_string(body);
    return envelope;
}

double roundMillis(double ms) {
    return std::round(ms * 100.0) / 100.0;
}

RequestHandler::RequestHandler(ModelInvoker& invoker) : invoker_(invoker) {}

ResponseEnvelope RequestHandler::handle(const InboundRequest& request, const ExecutionContext& context) noexcept {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    try {
        spdlog::info("Received {} request (body {} bytes)", request.http_method,
                     request.body ? request.body->size() : 0);
        if (request.body) {
            spdlog::debug("Request body: {}", *request.body);
        }

        auto validation = validateRequest(request);
        if (!validation.ok) {
            spdlog::debug("Request rejected: {}", validation.message);
            return createResponse(400, {
                {"error", true},
                {"message", validation.message},
                {"timestamp", unixSeconds()}
            });
        }

        if (validation.preflight) {
            return createResponse(200, {
                {"message", "CORS preflight successful"},
                {"timestamp", unixSeconds()}
            });
        }

        const GenerationParams& params = *validation.params;
        auto result = invoker_.invoke(params.prompt, params.max_tokens, params.temperature, params.top_p);

        const double ms = elapsed_ms();
        if (result.success) {
            spdlog::info("Successfully processed request in {:.2f}s", ms / 1000.0);
            return createResponse(200, {
                {"success", true},
                {"content", result.content},
                {"model_id", result.model_id},
                {"usage", result.usage},
                {"metadata", metadata(ms, context)}
            });
        }

        spdlog::error("Failed to process request: {} - {}", result.error_code, result.error_message);
        return createResponse(500, {
            {"success", false},
            {"error", {{"code", result.error_code}, {"message", result.error_message}}},
            {"metadata", metadata(ms, context)}
        });
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error in handler: {}", e.what());
    } catch (...) {
        spdlog::error("Unexpected non-standard exception in handler");
    }

    try {
        return createResponse(500, {
            {"success", false},
            {"error", {{"code", kInternalServerErrorCode}, {"message", kGenericErrorMessage}}},
            {"metadata", metadata(elapsed_ms(), context)}
        });
    } catch (const std::exception& e) {
        spdlog::critical("Failed to build error response: {}", e.what());
    }

    // Status only; no allocation left to fail.
    ResponseEnvelope fallback;
    fallback.status_code = 500;
    return fallback;
}

}  // namespace llmgate
