#pragma once

#include <kaizen_mcp/mcp/server_context.hpp>
#include <kaizen_mcp/mcp/tool_catalog.hpp>
#include <kaizen_mcp/mcp/tool_handlers.hpp>

#include <vector>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// ToolRegistry: routes a ToolKind to its handler.
//
// The tool set is closed, so there is nothing to register: Tools() is the
// static catalog and Execute() switches over ToolKind. Every call gets a
// fresh deadline of ServerContext::call_timeout.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    explicit ToolRegistry(ServerContext& ctx) : ctx_(ctx) {}

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept;

    /// Run the tool. Never throws; handler exceptions become tool failures.
    [[nodiscard]] ToolResult Execute(ToolKind kind,
                                     const nlohmann::json& arguments) const;

private:
    ServerContext& ctx_;
};

} // namespace kaizen_mcp
