#include "core/bedrock_client.h"

#include <sstream>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/bedrock-runtime/model/InvokeModelRequest.h>
#include <spdlog/spdlog.h>

#include "utils/config.h"
#include "utils/json_utils.h"

namespace llmgate {

namespace {

constexpr const char* kAllocationTag = "llmgate";

std::string defaultEndpoint(const std::string& region) {
    return "https://bedrock-runtime." + region + ".amazonaws.com";
}

}  // namespace

AwsSdkSession::AwsSdkSession() {
    Aws::InitAPI(options_);
}

AwsSdkSession::~AwsSdkSession() {
    Aws::ShutdownAPI(options_);
}

InvokeModelOutcome outcomeFromError(const Aws::Client::AWSError<Aws::BedrockRuntime::BedrockRuntimeErrors>& error) {
    const std::string name(error.GetExceptionName().c_str());
    const std::string message(error.GetMessage().c_str());

    if (error.GetErrorType() == Aws::BedrockRuntime::BedrockRuntimeErrors::NETWORK_CONNECTION ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
        return InvokeModelOutcome::error(InvokeErrorKind::Transport,
                                         name.empty() ? "ConnectionError" : name, message);
    }
    if (name.empty()) {
        return InvokeModelOutcome::error(InvokeErrorKind::Internal, "UnclassifiedError",
                                         "HTTP " + std::to_string(static_cast<int>(error.GetResponseCode())) +
                                             ": " + message);
    }

    auto outcome = InvokeModelOutcome::error(InvokeErrorKind::Provider, name, message);
    if (!error.GetRequestId().empty()) {
        outcome.request_id = std::string(error.GetRequestId().c_str());
    }
    return outcome;
}

BedrockRuntimeClient::BedrockRuntimeClient(const std::string& region,
                                           const std::string& endpoint_url,
                                           std::chrono::milliseconds timeout)
    : endpoint_url_(endpoint_url.empty() ? defaultEndpoint(region) : endpoint_url) {
    Aws::Client::ClientConfiguration cfg;
    cfg.region = region.c_str();
    if (!endpoint_url.empty()) {
        cfg.endpointOverride = endpoint_url.c_str();
    }
    cfg.connectTimeoutMs = static_cast<long>(timeout.count());
    cfg.requestTimeoutMs = static_cast<long>(timeout.count());
    // One call per request; failures are reported, not retried.
    cfg.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, 0);

    client_ = Aws::MakeShared<Aws::BedrockRuntime::BedrockRuntimeClient>(kAllocationTag, cfg);
}

std::unique_ptr<BedrockRuntimeClient> BedrockRuntimeClient::fromConfig(const GatewayConfig& config) {
    return std::make_unique<BedrockRuntimeClient>(config.region, config.endpoint_url, config.request_timeout);
}

InvokeModelOutcome BedrockRuntimeClient::invokeModel(const std::string& model_id,
                                                     const nlohmann::json& payload) {
    Aws::BedrockRuntime::Model::InvokeModelRequest request;
    request.SetModelId(model_id.c_str());
    request.SetContentType("application/json");
    request.SetAccept("application/json");

    auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
    *body << json_to_string(payload);
    request.SetBody(body);

    auto outcome = client_->InvokeModel(request);
    if (!outcome.IsSuccess()) {
        return outcomeFromError(outcome.GetError());
    }

    auto result = outcome.GetResultWithOwnership();
    std::ostringstream raw;
    raw << result.GetBody().rdbuf();

    std::optional<std::string> request_id;
    if (!result.GetRequestId().empty()) {
        request_id = std::string(result.GetRequestId().c_str());
    }

    std::string parse_error;
    auto parsed = parse_json(raw.str(), &parse_error);
    if (!parsed) {
        spdlog::debug("InvokeModel returned non-JSON body ({} bytes)", raw.str().size());
        return InvokeModelOutcome::error(InvokeErrorKind::Internal, "MalformedResponse",
                                         "response body is not JSON: " + parse_error);
    }
    return InvokeModelOutcome::success(std::move(*parsed), std::move(request_id));
}

}  // namespace llmgate
