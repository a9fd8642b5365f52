#include "core/model_invoker.h"

#include <spdlog/spdlog.h>

#include "utils/config.h"

namespace llmgate {

ModelInvoker::ModelInvoker(const GatewayConfig& config, ModelRuntimeClient& client)
    : config_(config), client_(client) {}

const std::string& ModelInvoker::modelId() const { return config_.model_id; }

ModelFamily ModelInvoker::family() const { return config_.model_family; }

SamplingParams ModelInvoker::effectiveParams(std::optional<int> max_tokens,
                                             std::optional<double> temperature,
                                             std::optional<double> top_p) const {
    SamplingParams params;
    params.max_tokens = max_tokens.value_or(config_.default_max_tokens);
    params.temperature = temperature.value_or(config_.default_temperature);
    params.top_p = top_p.value_or(config_.default_top_p);
    return params;
}

InvocationResult ModelInvoker::invoke(const std::string& prompt,
                                      std::optional<int> max_tokens,
                                      std::optional<double> temperature,
                                      std::optional<double> top_p) {
    try {
        const auto params = effectiveParams(max_tokens, temperature, top_p);
        const auto payload = buildPayload(config_.model_family, prompt, params);

        spdlog::info("Invoking Bedrock model: {}", config_.model_id);
        spdlog::debug("Request body: {}", payload.dump(2));

        auto outcome = client_.invokeModel(config_.model_id, payload);
        switch (outcome.error_kind) {
            case InvokeErrorKind::None:
                break;
            case InvokeErrorKind::Provider:
                spdlog::error("Bedrock ClientError: {} - {}", outcome.error_code, outcome.error_message);
                return InvocationResult::failure(outcome.error_code, outcome.error_message);
            case InvokeErrorKind::Transport:
            case InvokeErrorKind::Internal:
                spdlog::error("Bedrock call failed: {} - {}", outcome.error_code, outcome.error_message);
                return InvocationResult::failure(kInternalErrorCode, kGenericErrorMessage);
        }

        std::string extract_error;
        auto content = extractContent(config_.model_family, outcome.body, &extract_error);
        if (!content) {
            spdlog::error("Unexpected {} response shape: {}", to_string(config_.model_family), extract_error);
            return InvocationResult::failure(kInternalErrorCode, kGenericErrorMessage);
        }

        InvocationResult result;
        result.success = true;
        result.content = std::move(*content);
        result.model_id = config_.model_id;
        if (outcome.body.is_object() && outcome.body.contains("usage") && !outcome.body["usage"].is_null()) {
            result.usage = outcome.body["usage"];
        }
        result.request_id = std::move(outcome.request_id);
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error invoking Bedrock: {}", e.what());
        return InvocationResult::failure(kInternalErrorCode, kGenericErrorMessage);
    }
}

}  // namespace llmgate
