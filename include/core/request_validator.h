#pragma once

#include <optional>
#include <string>

#include "core/generation_types.h"

namespace llmgate {

struct ValidationResult {
    bool ok{false};
    bool preflight{false};  // OPTIONS: answer without calling the model
    std::string message;
    std::optional<GenerationParams> params;
};

// Checks method, body and generation fields of one trigger envelope.
// Never throws; unexpected failures become "Internal validation error".
ValidationResult validateRequest(const InboundRequest& request);

}  // namespace llmgate
