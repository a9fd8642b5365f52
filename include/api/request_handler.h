#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "core/generation_types.h"

namespace llmgate {

class ModelInvoker;

using HeaderMap = std::map<std::string, std::string>;

struct ResponseEnvelope {
    int status_code{200};
    HeaderMap headers;
    std::string body;  // serialized JSON

    // {"statusCode", "headers", "body"} as the HTTP trigger expects it.
    nlohmann::json toJson() const;
};

// Content-Type plus the CORS set carried by every response.
const HeaderMap& defaultResponseHeaders();

// extra_headers override the defaults with the same name.
ResponseEnvelope createResponse(int status_code,
                                const nlohmann::json& body,
                                const HeaderMap& extra_headers = {});

// Milliseconds rounded to 2 decimal places.
double roundMillis(double ms);

// Validator -> invoker -> envelope. One call per trigger event.
class RequestHandler {
public:
    explicit RequestHandler(ModelInvoker& invoker);

    // Never throws; every path yields a well-formed envelope.
    ResponseEnvelope handle(const InboundRequest& request, const ExecutionContext& context) noexcept;

private:
    ModelInvoker& invoker_;
};

}  // namespace llmgate
