#include "core/model_family.h"

#include "utils/json_utils.h"

namespace llmgate {

using json = nlohmann::json;

namespace {

std::optional<std::string> textAt(const json& response,
                                  const char* array_key,
                                  const char* text_key,
                                  std::string* error) {
    if (!response.is_object() || !response.contains(array_key)) {
        if (error) *error = std::string("response has no '") + array_key + "'";
        return std::nullopt;
    }
    const auto& items = response[array_key];
    if (!items.is_array() || items.empty() || !items[0].is_object()) {
        if (error) *error = std::string("'") + array_key + "' is not a non-empty array of objects";
        return std::nullopt;
    }
    const auto& first = items[0];
    if (!first.contains(text_key) || !first[text_key].is_string()) {
        if (error) *error = std::string("'") + array_key + "[0]." + text_key + "' is missing or not a string";
        return std::nullopt;
    }
    return first[text_key].get<std::string>();
}

std::string valueAsText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return json_to_string(v);
}

}  // namespace

ModelFamily resolveModelFamily(const std::string& model_id) {
    if (model_id.find("anthropic") != std::string::npos) {
        return ModelFamily::Anthropic;
    }
    if (model_id.find("amazon.titan") != std::string::npos) {
        return ModelFamily::AmazonTitan;
    }
    return ModelFamily::Generic;
}

const char* to_string(ModelFamily family) {
    switch (family) {
        case ModelFamily::Anthropic:
            return "anthropic";
        case ModelFamily::AmazonTitan:
            return "amazon.titan";
        case ModelFamily::Generic:
            return "generic";
    }
    return "generic";
}

json buildPayload(ModelFamily family, const std::string& prompt, const SamplingParams& params) {
    switch (family) {
        case ModelFamily::Anthropic:
            return json{
                {"anthropic_version", kAnthropicBedrockVersion},
                {"max_tokens", params.max_tokens},
                {"temperature", params.temperature},
                {"top_p", params.top_p},
                {"messages", json::array({
                    {{"role", "user"}, {"content", prompt}}
                })}
            };
        case ModelFamily::AmazonTitan:
            return json{
                {"inputText", prompt},
                {"textGenerationConfig", {
                    {"maxTokenCount", params.max_tokens},
                    {"temperature", params.temperature},
                    {"topP", params.top_p}
                }}
            };
        case ModelFamily::Generic:
            break;
    }
    return json{
        {"prompt", prompt},
        {"max_tokens", params.max_tokens},
        {"temperature", params.temperature},
        {"top_p", params.top_p}
    };
}

std::optional<std::string> extractContent(ModelFamily family,
                                          const json& response,
                                          std::string* error) {
    switch (family) {
        case ModelFamily::Anthropic:
            return textAt(response, "content", "text", error);
        case ModelFamily::AmazonTitan:
            return textAt(response, "results", "outputText", error);
        case ModelFamily::Generic:
            break;
    }
    // completion -> text -> whole response
    if (response.is_object()) {
        if (response.contains("completion") && !response["completion"].is_null()) {
            return valueAsText(response["completion"]);
        }
        if (response.contains("text") && !response["text"].is_null()) {
            return valueAsText(response["text"]);
        }
    }
    return json_to_string(response);
}

}  // namespace llmgate
