// request_id.h - simple request-id generator (hex)
#pragma once

#include <string>

namespace llmgate {

// Generate a random 16-hex-character request id.
std::string generate_request_id();

}  // namespace llmgate
