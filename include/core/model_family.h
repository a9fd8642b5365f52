#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace llmgate {

// Bedrock model families sharing one request/response JSON shape.
enum class ModelFamily {
    Anthropic,
    AmazonTitan,
    Generic,
};

// Substring match on the configured model id:
// "anthropic" -> Anthropic, "amazon.titan" -> AmazonTitan, otherwise Generic.
ModelFamily resolveModelFamily(const std::string& model_id);

const char* to_string(ModelFamily family);

// Effective (defaulted) sampling parameters for one call.
struct SamplingParams {
    int max_tokens{0};
    double temperature{0.0};
    double top_p{0.0};
};

constexpr const char* kAnthropicBedrockVersion = "bedrock-2023-05-31";

// Family-specific request body. Pure function of its inputs.
nlohmann::json buildPayload(ModelFamily family, const std::string& prompt, const SamplingParams& params);

// Family-specific generated text. Returns std::nullopt when the response does
// not have the expected shape; error receives a description.
std::optional<std::string> extractContent(ModelFamily family,
                                          const nlohmann::json& response,
                                          std::string* error = nullptr);

}  // namespace llmgate
