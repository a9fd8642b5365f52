#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace llmgate {

// Trigger envelope: one inbound HTTP request.
struct InboundRequest {
    std::string http_method;
    std::optional<std::string> body;
};

// Per-invocation data supplied by the trigger.
struct ExecutionContext {
    std::optional<std::string> request_id;
};

struct GenerationParams {
    std::string prompt;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    std::optional<double> top_p;
};

constexpr const char* kInternalErrorCode = "InternalError";
constexpr const char* kInternalServerErrorCode = "InternalServerError";
constexpr const char* kGenericErrorMessage = "An unexpected error occurred";

// Canonical result of one model call.
struct InvocationResult {
    bool success{false};
    std::string content;
    std::string model_id;
    nlohmann::json usage = nlohmann::json::object();
    std::optional<std::string> request_id;  // provider request id
    std::string error_code;
    std::string error_message;

    static InvocationResult failure(std::string code, std::string message) {
        InvocationResult r;
        r.error_code = std::move(code);
        r.error_message = std::move(message);
        return r;
    }
};

}  // namespace llmgate
