#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace llmgate {

enum class InvokeErrorKind {
    None,
    Provider,   // classified by the service: code + message are meaningful
    Transport,  // connection, TLS, timeout
    Internal,   // unreadable response, missing credentials, ...
};

struct InvokeModelOutcome {
    InvokeErrorKind error_kind{InvokeErrorKind::None};
    nlohmann::json body;
    std::optional<std::string> request_id;
    std::string error_code;
    std::string error_message;

    bool ok() const { return error_kind == InvokeErrorKind::None; }

    static InvokeModelOutcome success(nlohmann::json body, std::optional<std::string> request_id) {
        InvokeModelOutcome o;
        o.body = std::move(body);
        o.request_id = std::move(request_id);
        return o;
    }

    static InvokeModelOutcome error(InvokeErrorKind kind, std::string code, std::string message) {
        InvokeModelOutcome o;
        o.error_kind = kind;
        o.error_code = std::move(code);
        o.error_message = std::move(message);
        return o;
    }
};

// Remote model-inference service. One synchronous call, no retry.
// Implementations must be safe to call from several threads at once.
class ModelRuntimeClient {
public:
    virtual ~ModelRuntimeClient() = default;

    virtual InvokeModelOutcome invokeModel(const std::string& model_id, const nlohmann::json& payload) = 0;
};

}  // namespace llmgate
