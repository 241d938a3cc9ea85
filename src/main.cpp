#include <kaizen_mcp/api/api_client.hpp>
#include <kaizen_mcp/config/config_loader.hpp>
#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/core/version.hpp>
#include <kaizen_mcp/mcp/dispatcher.hpp>
#include <kaizen_mcp/mcp/mcp_server.hpp>
#include <kaizen_mcp/mcp/server_context.hpp>
#include <kaizen_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess     = 0;
constexpr int kExitServerError = 1;
constexpr int kExitConfig      = 2;

std::unique_ptr<kaizen_mcp::ILogSink> MakeSink(kaizen_mcp::LogFormat format) {
    using kaizen_mcp::LogFormat;
    switch (format) {
        case LogFormat::Json:
            return std::make_unique<kaizen_mcp::JsonSink>(std::cerr);
        case LogFormat::Text:
            return std::make_unique<kaizen_mcp::ConsoleSink>(std::cerr);
    }
    return std::make_unique<kaizen_mcp::JsonSink>(std::cerr);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace kaizen_mcp;

    // stdout carries protocol frames only; nothing else may write to it.
    std::ios::sync_with_stdio(false);

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << cli.Error().ToString() << "\n";
        return kExitConfig;
    }

    auto loaded = LoadConfig(cli.Value());
    if (loaded.IsErr()) {
        std::cerr << loaded.Error().ToString() << "\n";
        return kExitConfig;
    }
    const auto config = std::move(loaded).Value();

    InitGlobalLogger(MakeSink(config.log.format), config.log.level);

    LogInfo("main", "starting mcp server",
            {{"name", kServerName},
             {"version", kVersion},
             {"api_base_url", config.api.base_url.Value()}});
    if (config.api.api_key.empty()) {
        LogWarn("main", "no API key configured; tool calls will fail",
                {{"env", config.api.api_key_env}});
    }

    ApiClientOptions client_opts;
    client_opts.disable_tls_verify = config.api.disable_tls_verify;
    ApiClient client(config.api.base_url, config.api.api_key, client_opts);

    ServerContext ctx{client, std::chrono::seconds(config.api.timeout_seconds)};
    ToolRegistry registry(ctx);
    Dispatcher dispatcher(registry);
    McpServer server(dispatcher, std::cin, std::cout);

    auto run = server.Run();
    if (run.IsErr()) {
        LogError("main", "mcp server stopped with error",
                 {{"error", run.Error().ToString()}});
        return kExitServerError;
    }

    LogInfo("main", "mcp server stopped");
    return kExitSuccess;
}
