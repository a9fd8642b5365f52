#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>

namespace llmgate {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

bool parseBool(std::string value, bool fallback) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return fallback;
}

// Whole-string numeric parses; trailing characters reject the value.
std::optional<long long> parseInteger(const std::string& text) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseUnitInterval(const std::string& text) {
    try {
        size_t pos = 0;
        double v = std::stod(text, &pos);
        if (pos != text.size() || !(v >= 0.0 && v <= 1.0)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool inUnitInterval(double v) {
    return v >= 0.0 && v <= 1.0;
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    if (!std::filesystem::exists(path)) return false;
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;
        ifs >> out;
        return out.is_object();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to read config file {}: {}", path.string(), e.what());
        return false;
    }
}

}  // namespace

GatewayConfig loadGatewayConfig() {
    auto info = loadGatewayConfigWithLog();
    return info.first;
}

std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog() {
    GatewayConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    auto apply_json = [&](const nlohmann::json& j) {
        if (j.contains("model_id") && j["model_id"].is_string()) {
            cfg.model_id = j["model_id"].get<std::string>();
        }
        if (j.contains("region") && j["region"].is_string()) {
            cfg.region = j["region"].get<std::string>();
        }
        if (j.contains("endpoint_url") && j["endpoint_url"].is_string()) {
            cfg.endpoint_url = j["endpoint_url"].get<std::string>();
        }
        if (j.contains("max_tokens") && j["max_tokens"].is_number_integer()) {
            int v = j["max_tokens"].get<int>();
            if (v > 0) cfg.default_max_tokens = v;
        }
        if (j.contains("temperature") && j["temperature"].is_number()) {
            double v = j["temperature"].get<double>();
            if (inUnitInterval(v)) {
                cfg.default_temperature = v;
            } else {
                spdlog::warn("Config temperature {} outside [0, 1], ignored", v);
                log << "file:temperature ignored(" << v << ") ";
            }
        }
        if (j.contains("top_p") && j["top_p"].is_number()) {
            double v = j["top_p"].get<double>();
            if (inUnitInterval(v)) {
                cfg.default_top_p = v;
            } else {
                spdlog::warn("Config top_p {} outside [0, 1], ignored", v);
                log << "file:top_p ignored(" << v << ") ";
            }
        }
        if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) {
            long long ms = j["timeout_ms"].get<long long>();
            if (ms > 0) cfg.request_timeout = std::chrono::milliseconds(ms);
        }
        if (j.contains("log_level") && j["log_level"].is_string()) {
            cfg.log_level = j["log_level"].get<std::string>();
        }
        if (j.contains("port") && j["port"].is_number_integer()) {
            cfg.port = j["port"].get<int>();
        }
        if (j.contains("bind_address") && j["bind_address"].is_string()) {
            cfg.bind_address = j["bind_address"].get<std::string>();
        }
        if (j.contains("gzip") && j["gzip"].is_boolean()) {
            cfg.gzip_enabled = j["gzip"].get<bool>();
        }
    };

    // file
    if (auto env = getEnvValue("LLMGATE_CONFIG")) {
        nlohmann::json j;
        if (readJson(*env, j)) {
            apply_json(j);
            log << "file=" << *env << " ";
            used_file = true;
        }
    }

    // env overrides file
    if (auto env = getEnvValue("BEDROCK_MODEL_ID")) {
        if (!env->empty()) {
            cfg.model_id = *env;
            log << "env:BEDROCK_MODEL_ID=" << *env << " ";
            used_env = true;
        }
    }
    if (auto env = getEnvValue("AWS_REGION")) {
        if (!env->empty()) {
            cfg.region = *env;
            log << "env:AWS_REGION=" << *env << " ";
            used_env = true;
        }
    }
    if (auto env = getEnvValue("BEDROCK_ENDPOINT_URL")) {
        cfg.endpoint_url = *env;
        log << "env:BEDROCK_ENDPOINT_URL=" << *env << " ";
        used_env = true;
    }
    if (auto env = getEnvValue("MAX_TOKENS")) {
        auto v = parseInteger(*env);
        if (v && *v > 0 && *v <= std::numeric_limits<int>::max()) {
            cfg.default_max_tokens = static_cast<int>(*v);
            log << "env:MAX_TOKENS=" << *v << " ";
            used_env = true;
        } else {
            log << "env:MAX_TOKENS ignored(" << *env << ") ";
        }
    }
    if (auto env = getEnvValue("TEMPERATURE")) {
        if (auto v = parseUnitInterval(*env)) {
            cfg.default_temperature = *v;
            log << "env:TEMPERATURE=" << *v << " ";
            used_env = true;
        } else {
            log << "env:TEMPERATURE ignored(" << *env << ") ";
        }
    }
    if (auto env = getEnvValue("TOP_P")) {
        if (auto v = parseUnitInterval(*env)) {
            cfg.default_top_p = *v;
            log << "env:TOP_P=" << *v << " ";
            used_env = true;
        } else {
            log << "env:TOP_P ignored(" << *env << ") ";
        }
    }
    if (auto env = getEnvValue("BEDROCK_TIMEOUT_MS")) {
        auto ms = parseInteger(*env);
        if (ms && *ms > 0) {
            cfg.request_timeout = std::chrono::milliseconds(*ms);
            log << "env:BEDROCK_TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        } else {
            log << "env:BEDROCK_TIMEOUT_MS ignored(" << *env << ") ";
        }
    }
    if (auto env = getEnvValue("LOG_LEVEL")) {
        if (!env->empty()) {
            cfg.log_level = *env;
            used_env = true;
        }
    }
    if (auto env = getEnvValue("LLMGATE_PORT")) {
        auto v = parseInteger(*env);
        if (v && *v > 0 && *v < 65536) {
            cfg.port = static_cast<int>(*v);
            log << "env:PORT=" << *v << " ";
            used_env = true;
        } else {
            log << "env:PORT ignored(" << *env << ") ";
        }
    }
    if (auto env = getEnvValue("LLMGATE_BIND_ADDRESS")) {
        if (!env->empty()) {
            cfg.bind_address = *env;
            log << "env:BIND_ADDRESS=" << *env << " ";
            used_env = true;
        }
    }
    if (auto env = getEnvValue("LLMGATE_GZIP")) {
        cfg.gzip_enabled = parseBool(*env, cfg.gzip_enabled);
        used_env = true;
    }

    cfg.model_family = resolveModelFamily(cfg.model_id);

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace llmgate
