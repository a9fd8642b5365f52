// invoke command: run one trigger event through the request handler

#include "cli/commands.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <spdlog/spdlog.h>

#include "api/request_handler.h"
#include "api/trigger_event.h"
#include "utils/json_utils.h"

namespace llmgate {
namespace cli {
namespace commands {

int invoke(const InvokeOptions& options, RequestHandler& handler, std::istream& in, std::ostream& out) {
    std::string raw;
    if (options.event_file.empty()) {
        raw.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(options.event_file);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open event file: " << options.event_file << std::endl;
            return 1;
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        raw = ss.str();
    }

    std::string error;
    auto parsed = parse_json(raw, &error);
    if (!parsed) {
        std::cerr << "Error: event is not valid JSON: " << error << std::endl;
        return 1;
    }
    auto event = parseTriggerEvent(*parsed, &error);
    if (!event) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    auto envelope = handler.handle(event->request, event->context);
    spdlog::debug("Envelope status {}", envelope.status_code);
    if (options.pretty) {
        out << envelope.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        out << json_to_string(envelope.toJson()) << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace llmgate
