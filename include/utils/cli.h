#pragma once

#include <cstdint>
#include <string>

namespace llmgate {

/// Subcommand types for llmgate CLI
enum class Subcommand {
    None,    // No subcommand (serve)
    Serve,   // serve
    Invoke,  // invoke [--event FILE]
};

/// Options for serve command
struct ServeOptions {
    uint16_t port{0};  // 0 = use LLMGATE_PORT / config
    std::string host;  // empty = use LLMGATE_BIND_ADDRESS / config
};

/// Options for invoke command
struct InvokeOptions {
    std::string event_file;  // empty = read the event from stdin
    bool pretty{false};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};
    ServeOptions serve_options;
    InvokeOptions invoke_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

}  // namespace llmgate
