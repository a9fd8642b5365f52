#include <iostream>
#include <memory>
#include <signal.h>
#include <thread>
#include <chrono>
#include <string>
#include <spdlog/spdlog.h>

#include "api/http_server.h"
#include "api/request_handler.h"
#include "cli/commands.h"
#include "core/bedrock_client.h"
#include "core/model_invoker.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

llmgate::GatewayConfig load_config() {
    auto [cfg, log] = llmgate::loadGatewayConfigWithLog();
    llmgate::logger::apply_level(cfg.log_level);
    spdlog::info("Config: {}", log);
    spdlog::info("Model: {} (family: {}), region: {}", cfg.model_id,
                 llmgate::to_string(cfg.model_family), cfg.region);
    return cfg;
}

}  // namespace

int run_server(llmgate::GatewayConfig cfg, const llmgate::ServeOptions& options) {
    if (options.port != 0) {
        cfg.port = options.port;
    }
    if (!options.host.empty()) {
        cfg.bind_address = options.host;
    }

    try {
        auto client = llmgate::BedrockRuntimeClient::fromConfig(cfg);
        spdlog::info("Bedrock endpoint: {}", client->endpointUrl());
        llmgate::ModelInvoker invoker(cfg, *client);
        llmgate::RequestHandler handler(invoker);

        llmgate::HttpServer server(cfg.port, handler, cfg.bind_address);
        server.enableCompression(cfg.gzip_enabled);
        server.setLogger([](const httplib::Request& req, const httplib::Response& res) {
            spdlog::info("{} {} -> {}", req.method, req.path, res.status);
        });
        server.start();

        while (llmgate::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::info("Shutting down...");
        server.stop();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
    spdlog::info("Shutdown complete");
    return 0;
}

int run_invoke(const llmgate::GatewayConfig& cfg, const llmgate::InvokeOptions& options) {
    auto client = llmgate::BedrockRuntimeClient::fromConfig(cfg);
    llmgate::ModelInvoker invoker(cfg, *client);
    llmgate::RequestHandler handler(invoker);
    return llmgate::cli::commands::invoke(options, handler, std::cin, std::cout);
}

void signalHandler(int signal) {
    (void)signal;
    llmgate::request_shutdown();
}

int main(int argc, char* argv[]) {
    auto cli_result = llmgate::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    llmgate::logger::init_from_env(cli_result.subcommand == llmgate::Subcommand::Invoke);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    llmgate::AwsSdkSession aws_session;

    switch (cli_result.subcommand) {
        case llmgate::Subcommand::Invoke:
            return run_invoke(load_config(), cli_result.invoke_options);

        case llmgate::Subcommand::Serve:
        case llmgate::Subcommand::None:
        default:
            spdlog::info("llmgate v{} starting...", LLMGATE_VERSION);
            return run_server(load_config(), cli_result.serve_options);
    }
}
