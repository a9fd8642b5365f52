#include "utils/json_utils.h"

namespace llmgate {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        auto j = nlohmann::json::parse(body);
        return j;
    } catch (const std::exception& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

std::string json_to_string(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace llmgate
