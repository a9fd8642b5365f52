// json_utils.h - helpers for safe JSON parsing and extraction
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace llmgate {

// Parse JSON string; returns std::nullopt on error and fills error message if provided.
std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error = nullptr);

// Get value if present and convertible; otherwise fallback is returned.
template <typename T>
T get_or(const nlohmann::json& j, const std::string& key, const T& fallback) {
    if (!j.is_object() || !j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

// Compact JSON to string (no indentation). Non-ASCII text is emitted as UTF-8;
// invalid UTF-8 sequences are replaced instead of throwing.
std::string json_to_string(const nlohmann::json& j);

}  // namespace llmgate
