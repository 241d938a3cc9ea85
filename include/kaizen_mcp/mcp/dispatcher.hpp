#pragma once

#include <kaizen_mcp/mcp/jsonrpc.hpp>
#include <kaizen_mcp/mcp/tool_registry.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

inline constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// Dispatcher: routes one decoded request to its method handler.
//
//   initialize                          server info and capabilities
//   notifications/initialized, initialized
//                                       never answered
//   ping                                empty result
//   tools/list                          static catalog
//   tools/call                          ToolRegistry::Execute
//   anything else                       -32601 "method not found"
//
// Dispatch() returns nullopt whenever the request carried no id; the
// handler still runs.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry) : registry_(registry) {}

    [[nodiscard]] std::optional<Response> Dispatch(const Request& request) const;

private:
    [[nodiscard]] Result<nlohmann::json, RpcError> Route(
        const Request& request) const;

    [[nodiscard]] nlohmann::json HandleInitialize() const;
    [[nodiscard]] nlohmann::json HandleToolsList() const;
    [[nodiscard]] Result<nlohmann::json, RpcError> HandleToolsCall(
        const nlohmann::json& params) const;

    const ToolRegistry& registry_;
};

} // namespace kaizen_mcp
