#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <aws/core/Aws.h>
#include <aws/core/client/AWSError.h>
#include <aws/bedrock-runtime/BedrockRuntimeClient.h>
#include <aws/bedrock-runtime/BedrockRuntimeErrors.h>

#include "core/model_runtime_client.h"

namespace llmgate {

struct GatewayConfig;

// Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the process.
// Every BedrockRuntimeClient must be destroyed before this.
class AwsSdkSession {
public:
    AwsSdkSession();
    ~AwsSdkSession();

    AwsSdkSession(const AwsSdkSession&) = delete;
    AwsSdkSession& operator=(const AwsSdkSession&) = delete;

private:
    Aws::SDKOptions options_;
};

// Service errors carrying an exception name are Provider errors; connection
// failures are Transport; anything else is Internal.
InvokeModelOutcome outcomeFromError(const Aws::Client::AWSError<Aws::BedrockRuntime::BedrockRuntimeErrors>& error);

// Bedrock Runtime InvokeModel through the AWS SDK. Credentials come from the
// SDK default provider chain (environment, shared profile, container, IMDS).
class BedrockRuntimeClient : public ModelRuntimeClient {
public:
    BedrockRuntimeClient(const std::string& region,
                         const std::string& endpoint_url,
                         std::chrono::milliseconds timeout);

    static std::unique_ptr<BedrockRuntimeClient> fromConfig(const GatewayConfig& config);

    InvokeModelOutcome invokeModel(const std::string& model_id, const nlohmann::json& payload) override;

    // Override URL, or the regional default when none is configured.
    const std::string& endpointUrl() const { return endpoint_url_; }

private:
    std::string endpoint_url_;
    std::shared_ptr<Aws::BedrockRuntime::BedrockRuntimeClient> client_;
};

}  // namespace llmgate
