// CLI command function declarations
#pragma once

#include <iosfwd>

#include "utils/cli.h"

namespace llmgate {

class RequestHandler;

namespace cli {
namespace commands {

// Note: 'serve' is implemented in main.cpp as it owns the signal handling
// and the server lifetime.

/// Execute the 'invoke' command: read one trigger event, print the
/// response envelope JSON.
/// @param options Invoke options (event file, pretty)
/// @param handler Request handler wired to the configured model
/// @param in Event source when options.event_file is empty
/// @param out Destination of the envelope
/// @return Exit code (0=envelope printed, 1=unreadable event)
int invoke(const InvokeOptions& options, RequestHandler& handler, std::istream& in, std::ostream& out);

}  // namespace commands
}  // namespace cli
}  // namespace llmgate
