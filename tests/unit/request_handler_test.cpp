#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

#include "api/request_handler.h"
#include "core/model_invoker.h"
#include "test_support.h"

using namespace llmgate;
using llmgate::testing::FakeRuntimeClient;
using llmgate::testing::makeConfig;
using json = nlohmann::json;

namespace {

class RequestHandlerFixture : public ::testing::Test {
protected:
    void useModel(const std::string& model_id) { cfg_ = makeConfig(model_id); }

    ResponseEnvelope send(const std::string& method,
                          std::optional<std::string> body,
                          std::optional<std::string> request_id = std::nullopt) {
        ModelInvoker invoker(cfg_, client_);
        RequestHandler handler(invoker);
        return handler.handle(InboundRequest{method, std::move(body)}, ExecutionContext{std::move(request_id)});
    }

    static void expectCorsHeaders(const ResponseEnvelope& env) {
        EXPECT_EQ(env.headers.at("Content-Type"), "application/json");
        EXPECT_EQ(env.headers.at("Access-Control-Allow-Origin"), "*");
        EXPECT_EQ(env.headers.at("Access-Control-Allow-Headers"),
                  "Content-Type,X-Amz-Date,Authorization,X-Api-Key,X-Amz-Security-Token");
        EXPECT_EQ(env.headers.at("Access-Control-Allow-Methods"), "GET,POST,OPTIONS");
    }

    GatewayConfig cfg_ = makeConfig("anthropic.claude-3-sonnet-20240229-v1:0");
    FakeRuntimeClient client_;
};

// Throws past ModelInvoker's own error normalization.
template <typename Thrown>
class ThrowingInvoker : public ModelInvoker {
public:
    ThrowingInvoker(const GatewayConfig& config, ModelRuntimeClient& client, Thrown thrown)
        : ModelInvoker(config, client), thrown_(std::move(thrown)) {}

    InvocationResult invoke(const std::string&,
                            std::optional<int>,
                            std::optional<double>,
                            std::optional<double>) override {
        throw thrown_;
    }

private:
    Thrown thrown_;
};

void expectInternalServerError(const ResponseEnvelope& env) {
    EXPECT_EQ(env.status_code, 500);
    EXPECT_EQ(env.headers.at("Access-Control-Allow-Origin"), "*");
    auto body = json::parse(env.body);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"]["code"], "InternalServerError");
    EXPECT_EQ(body["error"]["message"], "An unexpected error occurred");
    EXPECT_TRUE(body["metadata"]["execution_time_ms"].is_number());
    EXPECT_EQ(body["metadata"]["request_id"], "ctx-9");
}

}  // namespace

TEST_F(RequestHandlerFixture, PreflightDoesNotCallModel) {
    auto env = send("OPTIONS", std::nullopt);
    EXPECT_EQ(env.status_code, 200);
    expectCorsHeaders(env);
    auto body = json::parse(env.body);
    EXPECT_EQ(body["message"], "CORS preflight successful");
    EXPECT_TRUE(body["timestamp"].is_number_integer());
    EXPECT_EQ(client_.calls, 0);
}

TEST_F(RequestHandlerFixture, ValidationFailureIs400) {
    auto env = send("GET", std::nullopt);
    EXPECT_EQ(env.status_code, 400);
    expectCorsHeaders(env);
    auto body = json::parse(env.body);
    EXPECT_EQ(body["error"], true);
    EXPECT_EQ(body["message"], "Only POST method is supported");
    EXPECT_TRUE(body.contains("timestamp"));
    EXPECT_EQ(client_.calls, 0);
}

TEST_F(RequestHandlerFixture, MissingPromptIs400) {
    auto env = send("POST", std::string(R"({"max_tokens":10})"));
    EXPECT_EQ(env.status_code, 400);
    EXPECT_EQ(json::parse(env.body)["message"], "Prompt is required in request body");
    EXPECT_EQ(client_.calls, 0);
}

TEST_F(RequestHandlerFixture, AnthropicSuccessRoundTrip) {
    client_.respondWith(json{
        {"content", json::array({{{"type", "text"}, {"text", "literal reply"}}})},
        {"usage", {{"input_tokens", 5}, {"output_tokens", 7}}}
    });

    auto env = send("POST", std::string(R"({"prompt":"Hello","max_tokens":100})"), std::string("ctx-1"));
    EXPECT_EQ(env.status_code, 200);
    expectCorsHeaders(env);

    auto body = json::parse(env.body);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["content"], "literal reply");
    EXPECT_EQ(body["model_id"], "anthropic.claude-3-sonnet-20240229-v1:0");
    EXPECT_EQ(body["usage"]["output_tokens"], 7);
    EXPECT_GE(body["metadata"]["execution_time_ms"].get<double>(), 0.0);
    EXPECT_TRUE(body["metadata"]["timestamp"].is_number_integer());
    EXPECT_EQ(body["metadata"]["request_id"], "ctx-1");

    EXPECT_EQ(client_.calls, 1);
    EXPECT_EQ(client_.last_payload["max_tokens"], 100);
    EXPECT_EQ(client_.last_payload["messages"][0]["content"], "Hello");
}

TEST_F(RequestHandlerFixture, TitanScenario) {
    useModel("amazon.titan-text-express-v1");
    client_.respondWith(json{{"results", json::array({{{"outputText", "hello"}}})}});

    auto env = send("POST", std::string(R"({"prompt":"Say hello","temperature":0.2})"));
    ASSERT_EQ(env.status_code, 200);
    auto body = json::parse(env.body);
    EXPECT_EQ(body["content"], "hello");
    EXPECT_EQ(body["model_id"], "amazon.titan-text-express-v1");
    EXPECT_EQ(body["usage"], json::object());
    EXPECT_TRUE(body["metadata"]["request_id"].is_null());
    EXPECT_EQ(client_.last_payload["inputText"], "Say hello");
    EXPECT_DOUBLE_EQ(client_.last_payload["textGenerationConfig"]["temperature"].get<double>(), 0.2);
}

TEST_F(RequestHandlerFixture, GenericFamilyUsesTextField) {
    useModel("some.other.model");
    client_.respondWith(json{{"text", "fallback reply"}});

    auto env = send("POST", std::string(R"({"prompt":"p"})"));
    ASSERT_EQ(env.status_code, 200);
    EXPECT_EQ(json::parse(env.body)["content"], "fallback reply");
    EXPECT_EQ(client_.last_payload["prompt"], "p");
}

TEST_F(RequestHandlerFixture, ProviderErrorIs500WithCode) {
    client_.failWith(InvokeErrorKind::Provider, "ThrottlingException", "Rate exceeded");

    auto env = send("POST", std::string(R"({"prompt":"p"})"), std::string("ctx-2"));
    EXPECT_EQ(env.status_code, 500);
    expectCorsHeaders(env);
    auto body = json::parse(env.body);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"]["code"], "ThrottlingException");
    EXPECT_EQ(body["error"]["message"], "Rate exceeded");
    EXPECT_EQ(body["metadata"]["request_id"], "ctx-2");
    EXPECT_FALSE(body.contains("content"));
}

TEST_F(RequestHandlerFixture, ThrowingClientYieldsGenericInternalError) {
    client_.throw_on_call = true;

    auto env = send("POST", std::string(R"({"prompt":"p"})"));
    EXPECT_EQ(env.status_code, 500);
    auto body = json::parse(env.body);
    EXPECT_EQ(body["error"]["code"], "InternalError");
    EXPECT_EQ(body["error"]["message"], "An unexpected error occurred");
    EXPECT_EQ(env.body.find("10.0.0.1"), std::string::npos);
}

TEST_F(RequestHandlerFixture, InvokerExceptionYieldsInternalServerError) {
    ThrowingInvoker<std::runtime_error> invoker(cfg_, client_, std::runtime_error("invoker exploded"));
    RequestHandler handler(invoker);
    auto env = handler.handle(InboundRequest{"POST", std::string(R"({"prompt":"Hello"})")},
                              ExecutionContext{std::string("ctx-9")});
    expectInternalServerError(env);
}

TEST_F(RequestHandlerFixture, NonStandardInvokerExceptionYieldsInternalServerError) {
    ThrowingInvoker<int> invoker(cfg_, client_, 42);
    RequestHandler handler(invoker);
    auto env = handler.handle(InboundRequest{"POST", std::string(R"({"prompt":"Hello"})")},
                              ExecutionContext{std::string("ctx-9")});
    expectInternalServerError(env);
}

TEST(ResponseEnvelopeTest, CreateResponseMergesExtraHeaders) {
    auto env = createResponse(201, json{{"k", "v"}}, {{"X-Extra", "1"}, {"Access-Control-Allow-Origin", "https://a.example"}});
    EXPECT_EQ(env.status_code, 201);
    EXPECT_EQ(env.headers.at("X-Extra"), "1");
    EXPECT_EQ(env.headers.at("Access-Control-Allow-Origin"), "https://a.example");
    EXPECT_EQ(env.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(env.body, R"({"k":"v"})");
}

TEST(ResponseEnvelopeTest, KeepsNonAsciiAsUtf8) {
    auto env = createResponse(200, json{{"content", "こんにちは"}});
    EXPECT_NE(env.body.find("こんにちは"), std::string::npos);
}

TEST(ResponseEnvelopeTest, ToJsonUsesTriggerFieldNames) {
    auto j = createResponse(400, json{{"error", true}}).toJson();
    EXPECT_EQ(j["statusCode"], 400);
    EXPECT_TRUE(j["headers"].is_object());
    EXPECT_TRUE(j["body"].is_string());
    EXPECT_EQ(json::parse(j["body"].get<std::string>())["error"], true);
}

TEST(ResponseEnvelopeTest, RoundMillisKeepsTwoDecimals) {
    EXPECT_DOUBLE_EQ(roundMillis(12.3456), 12.35);
    EXPECT_DOUBLE_EQ(roundMillis(0.001), 0.0);
    EXPECT_DOUBLE_EQ(roundMillis(1500.0), 1500.0);
}
