#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>
#include <stdexcept>

namespace llmgate {

std::string getServeHelpMessage();
std::string getInvokeHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "llmgate " << LLMGATE_VERSION << " - Bedrock text-generation proxy\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    llmgate <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    serve      Start the HTTP server (default)\n";
    oss << "    invoke     Handle one trigger event and print the response envelope\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'llmgate <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "llmgate serve - Start the HTTP server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    llmgate serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>         Server port (default: 8080, or LLMGATE_PORT)\n";
    oss << "    --host <HOST>         Bind address (default: 0.0.0.0)\n";
    oss << "    -h, --help            Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    BEDROCK_MODEL_ID          Model id (default: anthropic.claude-3-sonnet-20240229-v1:0)\n";
    oss << "    AWS_REGION                Bedrock region (default: us-east-1)\n";
    oss << "    BEDROCK_ENDPOINT_URL      Override the Bedrock Runtime endpoint\n";
    oss << "    BEDROCK_TIMEOUT_MS        Connect/read timeout for model calls (default: 60000)\n";
    oss << "    MAX_TOKENS                Default max_tokens (default: 1000)\n";
    oss << "    TEMPERATURE               Default temperature (default: 0.7)\n";
    oss << "    TOP_P                     Default top_p (default: 0.9)\n";
    oss << "    LOG_LEVEL                 Log level (trace|debug|info|warn|error)\n";
    oss << "    LLMGATE_LOG_FILE          Additional JSON-lines log file\n";
    oss << "    LLMGATE_CONFIG            JSON config file\n";
    oss << "    LLMGATE_GZIP              Compress responses for gzip clients (default: true)\n";
    oss << "    AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN\n";
    return oss.str();
}

std::string getInvokeHelpMessage() {
    std::ostringstream oss;
    oss << "llmgate invoke - Handle one trigger event\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    llmgate invoke [--event <FILE>] [--pretty]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --event <FILE>    Event JSON ({\"httpMethod\", \"body\"}); stdin when omitted\n";
    oss << "    --pretty          Indent the printed envelope\n";
    oss << "    -h, --help        Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "llmgate " << LLMGATE_VERSION << "\n";
    return oss.str();
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.subcommand = Subcommand::None;
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "serve") == 0) {
        result.subcommand = Subcommand::Serve;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getServeHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                const char* value = argv[++i];
                int port = 0;
                try {
                    port = std::stoi(value);
                } catch (const std::exception&) {
                    port = 0;
                }
                if (port <= 0 || port > 65535) {
                    result.should_exit = true;
                    result.exit_code = 1;
                    result.output = std::string("Error: invalid port: ") + value + "\n";
                    return result;
                }
                result.serve_options.port = static_cast<uint16_t>(port);
            } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                result.serve_options.host = argv[++i];
            } else {
                result.should_exit = true;
                result.exit_code = 1;
                result.output = std::string("Unknown option: ") + argv[i] + "\n\n" + getServeHelpMessage();
                return result;
            }
        }
        return result;
    }

    if (std::strcmp(command, "invoke") == 0) {
        result.subcommand = Subcommand::Invoke;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getInvokeHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--event") == 0 && i + 1 < argc) {
                result.invoke_options.event_file = argv[++i];
            } else if (std::strcmp(argv[i], "--pretty") == 0) {
                result.invoke_options.pretty = true;
            } else {
                result.should_exit = true;
                result.exit_code = 1;
                result.output = std::string("Unknown option: ") + argv[i] + "\n\n" + getInvokeHelpMessage();
                return result;
            }
        }
        return result;
    }

    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

}  // namespace llmgate
