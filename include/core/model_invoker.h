#pragma once

#include <optional>
#include <string>

#include "core/generation_types.h"
#include "core/model_family.h"
#include "core/model_runtime_client.h"

namespace llmgate {

struct GatewayConfig;

// Shapes the family-specific payload, calls the runtime once and normalizes
// the response. Holds references only; config and client must outlive it.
class ModelInvoker {
public:
    ModelInvoker(const GatewayConfig& config, ModelRuntimeClient& client);
    virtual ~ModelInvoker() = default;

    virtual InvocationResult invoke(const std::string& prompt,
                            std::optional<int> max_tokens = std::nullopt,
                            std::optional<double> temperature = std::nullopt,
                            std::optional<double> top_p = std::nullopt);

    // Effective parameters after applying configured defaults.
    SamplingParams effectiveParams(std::optional<int> max_tokens,
                                   std::optional<double> temperature,
                                   std::optional<double> top_p) const;

    const std::string& modelId() const;
    ModelFamily family() const;

private:
    const GatewayConfig& config_;
    ModelRuntimeClient& client_;
};

}  // namespace llmgate
