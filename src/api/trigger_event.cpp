#include "api/trigger_event.h"

#include "utils/json_utils.h"

namespace llmgate {

std::optional<TriggerEvent> parseTriggerEvent(const nlohmann::json& event, std::string* error) {
    if (!event.is_object()) {
        if (error) *error = "event must be a JSON object";
        return std::nullopt;
    }

    TriggerEvent out;
    out.request.http_method = get_or<std::string>(event, "httpMethod", "");

    if (event.contains("body") && !event["body"].is_null()) {
        const auto& body = event["body"];
        // Test events sometimes carry the body as an inline object.
        out.request.body = body.is_string() ? body.get<std::string>() : json_to_string(body);
    }

    if (event.contains("requestContext") && event["requestContext"].is_object()) {
        auto id = get_or<std::string>(event["requestContext"], "requestId", "");
        if (!id.empty()) out.context.request_id = std::move(id);
    }
    return out;
}

}  // namespace llmgate
