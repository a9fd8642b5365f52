#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "core/model_invoker.h"
#include "test_support.h"

using namespace llmgate;
using llmgate::testing::FakeRuntimeClient;
using llmgate::testing::makeConfig;
using json = nlohmann::json;

namespace {
json anthropicReply(const std::string& text) {
    return json{
        {"content", json::array({{{"type", "text"}, {"text", text}}})},
        {"usage", {{"input_tokens", 10}, {"output_tokens", 20}}}
    };
}
}  // namespace

TEST(ModelInvokerTest, AppliesConfiguredDefaults) {
    auto cfg = makeConfig("anthropic.claude-3-sonnet-20240229-v1:0");
    FakeRuntimeClient client;
    client.respondWith(anthropicReply("ok"));
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(client.calls, 1);
    EXPECT_EQ(client.last_model_id, "anthropic.claude-3-sonnet-20240229-v1:0");
    EXPECT_EQ(client.last_payload["max_tokens"], 1000);
    EXPECT_DOUBLE_EQ(client.last_payload["temperature"].get<double>(), 0.7);
    EXPECT_DOUBLE_EQ(client.last_payload["top_p"].get<double>(), 0.9);
}

TEST(ModelInvokerTest, ExplicitParamsOverrideDefaultsIncludingZero) {
    auto cfg = makeConfig("amazon.titan-text-express-v1");
    FakeRuntimeClient client;
    client.respondWith(json{{"results", json::array({{{"outputText", "hi"}}})}});
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello", 42, 0.0, 0.0);
    ASSERT_TRUE(result.success);
    const auto& gen = client.last_payload["textGenerationConfig"];
    EXPECT_EQ(gen["maxTokenCount"], 42);
    EXPECT_DOUBLE_EQ(gen["temperature"].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(gen["topP"].get<double>(), 0.0);
}

TEST(ModelInvokerTest, EffectiveParamsUseOverriddenConfig) {
    auto cfg = makeConfig("some.other.model");
    cfg.default_max_tokens = 64;
    cfg.default_temperature = 0.2;
    cfg.default_top_p = 0.5;
    FakeRuntimeClient client;
    ModelInvoker invoker(cfg, client);

    auto params = invoker.effectiveParams(std::nullopt, 0.9, std::nullopt);
    EXPECT_EQ(params.max_tokens, 64);
    EXPECT_DOUBLE_EQ(params.temperature, 0.9);
    EXPECT_DOUBLE_EQ(params.top_p, 0.5);
    EXPECT_EQ(invoker.family(), ModelFamily::Generic);
    EXPECT_EQ(invoker.modelId(), "some.other.model");
}

TEST(ModelInvokerTest, SuccessCarriesContentUsageAndRequestId) {
    auto cfg = makeConfig("anthropic.claude-3-haiku-20240307-v1:0");
    FakeRuntimeClient client;
    client.respondWith(anthropicReply("literal reply"), std::string("req-123"));
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.content, "literal reply");
    EXPECT_EQ(result.model_id, "anthropic.claude-3-haiku-20240307-v1:0");
    EXPECT_EQ(result.usage["input_tokens"], 10);
    EXPECT_EQ(result.usage["output_tokens"], 20);
    EXPECT_EQ(result.request_id, "req-123");
    EXPECT_TRUE(result.error_code.empty());
}

TEST(ModelInvokerTest, MissingUsageBecomesEmptyObject) {
    auto cfg = makeConfig("some.other.model");
    FakeRuntimeClient client;
    client.respondWith(json{{"completion", "done"}, {"usage", nullptr}});
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.content, "done");
    EXPECT_TRUE(result.usage.is_object());
    EXPECT_TRUE(result.usage.empty());
}

TEST(ModelInvokerTest, ProviderErrorIsPassedThrough) {
    auto cfg = makeConfig("anthropic.claude-3-sonnet-20240229-v1:0");
    FakeRuntimeClient client;
    client.failWith(InvokeErrorKind::Provider, "ThrottlingException", "Rate exceeded");
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, "ThrottlingException");
    EXPECT_EQ(result.error_message, "Rate exceeded");
}

TEST(ModelInvokerTest, TransportAndInternalErrorsAreMasked) {
    auto cfg = makeConfig("anthropic.claude-3-sonnet-20240229-v1:0");
    for (auto kind : {InvokeErrorKind::Transport, InvokeErrorKind::Internal}) {
        FakeRuntimeClient client;
        client.failWith(kind, "ConnectionError", "connect to 10.0.0.1:443 failed");
        ModelInvoker invoker(cfg, client);

        auto result = invoker.invoke("Hello");
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error_code, "InternalError");
        EXPECT_EQ(result.error_message, "An unexpected error occurred");
    }
}

TEST(ModelInvokerTest, UnexpectedResponseShapeIsInternalError) {
    auto cfg = makeConfig("anthropic.claude-3-sonnet-20240229-v1:0");
    FakeRuntimeClient client;
    client.respondWith(json{{"content", json::array()}});
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, "InternalError");
    EXPECT_EQ(result.error_message, "An unexpected error occurred");
}

TEST(ModelInvokerTest, ThrowingClientDoesNotLeakDetails) {
    auto cfg = makeConfig("anthropic.claude-3-sonnet-20240229-v1:0");
    FakeRuntimeClient client;
    client.throw_on_call = true;
    ModelInvoker invoker(cfg, client);

    auto result = invoker.invoke("Hello");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, "InternalError");
    EXPECT_EQ(result.error_message.find("10.0.0.1"), std::string::npos);
}
