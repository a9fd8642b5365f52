#include "core/request_validator.h"

#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/json_utils.h"

namespace llmgate {

using json = nlohmann::json;

namespace {

ValidationResult reject(std::string message) {
    ValidationResult r;
    r.message = std::move(message);
    return r;
}

bool isUnitInterval(const json& v) {
    if (!v.is_number()) return false;
    const double d = v.get<double>();
    return d >= 0.0 && d <= 1.0;
}

ValidationResult validateBody(const std::string& raw) {
    std::string parse_error;
    auto parsed = parse_json(raw, &parse_error);
    if (!parsed) {
        spdlog::debug("Rejecting request body: {}", parse_error);
        return reject("Invalid JSON in request body");
    }
    const json& body = *parsed;
    if (!body.is_object()) {
        return reject("Request body must be a JSON object");
    }

    if (!body.contains("prompt") || !body["prompt"].is_string() ||
        body["prompt"].get_ref<const std::string&>().empty()) {
        return reject("Prompt is required in request body");
    }

    GenerationParams params;
    params.prompt = body["prompt"].get<std::string>();

    if (body.contains("max_tokens")) {
        const auto& v = body["max_tokens"];
        // is_number_integer() excludes booleans and floats such as 5.0
        if (!v.is_number_integer() || v.get<long long>() < 1 ||
            v.get<long long>() > std::numeric_limits<int>::max()) {
            return reject("max_tokens must be a positive integer");
        }
        params.max_tokens = v.get<int>();
    }
    if (body.contains("temperature")) {
        if (!isUnitInterval(body["temperature"])) {
            return reject("temperature must be a number between 0 and 1");
        }
        params.temperature = body["temperature"].get<double>();
    }
    if (body.contains("top_p")) {
        if (!isUnitInterval(body["top_p"])) {
            return reject("top_p must be a number between 0 and 1");
        }
        params.top_p = body["top_p"].get<double>();
    }

    ValidationResult r;
    r.ok = true;
    r.message = "Valid request";
    r.params = std::move(params);
    return r;
}

}  // namespace

ValidationResult validateRequest(const InboundRequest& request) {
    try {
        if (request.http_method == "OPTIONS") {
            ValidationResult r;
            r.ok = true;
            r.preflight = true;
            r.message = "CORS preflight";
            return r;
        }
        if (request.http_method != "POST") {
            return reject("Only POST method is supported");
        }
        if (!request.body || request.body->empty()) {
            return reject("Request body is required");
        }
        return validateBody(*request.body);
    } catch (const std::exception& e) {
        spdlog::error("Error validating request: {}", e.what());
        return reject("Internal validation error");
    }
}

}  // namespace llmgate
