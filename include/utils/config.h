#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "core/model_family.h"

namespace llmgate {

struct GatewayConfig {
    std::string model_id{"anthropic.claude-3-sonnet-20240229-v1:0"};
    ModelFamily model_family{ModelFamily::Anthropic};  // resolved from model_id
    std::string region{"us-east-1"};
    std::string endpoint_url;  // empty = https://bedrock-runtime.<region>.amazonaws.com
    int default_max_tokens{1000};
    double default_temperature{0.7};
    double default_top_p{0.9};
    std::chrono::milliseconds request_timeout{60000};
    std::string log_level{"INFO"};
    int port{8080};
    std::string bind_address{"0.0.0.0"};
    bool gzip_enabled{true};
};

GatewayConfig loadGatewayConfig();
std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog();

}  // namespace llmgate
