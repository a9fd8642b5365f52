#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/generation_types.h"

namespace llmgate {

struct TriggerEvent {
    InboundRequest request;
    ExecutionContext context;
};

// Reads an API-Gateway style event: httpMethod, body (string or null) and
// requestContext.requestId. Returns std::nullopt when the event is not a
// JSON object; error receives the reason.
std::optional<TriggerEvent> parseTriggerEvent(const nlohmann::json& event, std::string* error = nullptr);

}  // namespace llmgate
