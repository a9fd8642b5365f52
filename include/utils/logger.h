// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace llmgate::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
// With neither a file path nor sinks, logs go to stdout.
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Set the default logger level from text (e.g. the configured log_level).
void apply_level(const std::string& level_text);

// Initialize using environment variables:
// LOG_LEVEL (trace|debug|info|warn|error|critical|off, default: INFO)
// LLMGATE_LOG_FILE (optional JSON-lines file, in addition to the console)
// use_stderr sends console output to stderr (stdout stays machine-readable).
void init_from_env(bool use_stderr = false);

}  // namespace llmgate::logger
