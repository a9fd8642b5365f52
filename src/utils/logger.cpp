#include "utils/logger.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace llmgate::logger {

namespace {
    constexpr const char* LOG_LEVEL_ENV = "LOG_LEVEL";
    constexpr const char* LOG_FILE_ENV = "LLMGATE_LOG_FILE";
    constexpr const char* CONSOLE_PATTERN = "[%Y-%m-%d %T.%e] [%l] %v";
    constexpr const char* JSONL_PATTERN = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})";
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty() && sinks.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("llmgate", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void apply_level(const std::string& level_text) {
    spdlog::set_level(parse_level(level_text));
}

void init_from_env(bool use_stderr) {
    std::string level = "info";
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        level = env;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (human-readable format)
    spdlog::sink_ptr console_sink;
    if (use_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    // File sink (JSON format for structured logging)
    std::string log_path;
    if (const char* env = std::getenv(LOG_FILE_ENV)) {
        log_path = env;
    }
    if (!log_path.empty()) {
        std::error_code ec;
        auto parent = fs::path(log_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
        file_sink->set_pattern(JSONL_PATTERN);
        sinks.push_back(file_sink);
    }

    // Preserve per-sink patterns (stdout human-readable, file JSON).
    init(level, "", "", sinks);

    if (!log_path.empty()) {
        spdlog::info("Logs initialized: console + {}", log_path);
    }
}

}  // namespace llmgate::logger
