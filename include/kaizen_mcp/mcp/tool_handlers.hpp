#pragma once

#include <kaizen_mcp/core/result.hpp>
#include <kaizen_mcp/core/types.hpp>
#include <kaizen_mcp/mcp/server_context.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// ToolResult: outcome of one tool invocation.
//
// A failed tool is still a successful JSON-RPC call: the failure travels as
// isError=true plus a text block, inside the "result" member.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();
    std::optional<nlohmann::json> structured_content;

    /// Success: the payload pretty-printed as text plus the raw payload.
    static ToolResult Success(const nlohmann::json& data);

    /// Failure: one human-readable text block, isError=true.
    static ToolResult Failure(const std::string& message);

    /// {"content":[...], "isError":true} or {"content":[...], "structuredContent":{...}}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// Tool handlers. Each validates its arguments before touching the executor;
// validation and executor failures come back as ToolResult::Failure.
ToolResult HandleAkumaQuery(ServerContext& ctx, const nlohmann::json& args,
                            const Deadline& deadline);
ToolResult HandleAkumaExplain(ServerContext& ctx, const nlohmann::json& args,
                              const Deadline& deadline);
ToolResult HandleAkumaSchema(ServerContext& ctx, const nlohmann::json& args,
                             const Deadline& deadline);
ToolResult HandleEnzanSummary(ServerContext& ctx, const nlohmann::json& args,
                              const Deadline& deadline);
ToolResult HandleEnzanBurn(ServerContext& ctx, const nlohmann::json& args,
                           const Deadline& deadline);
ToolResult HandleSozoGenerate(ServerContext& ctx, const nlohmann::json& args,
                              const Deadline& deadline);
ToolResult HandleSozoSchemas(ServerContext& ctx, const nlohmann::json& args,
                             const Deadline& deadline);

} // namespace kaizen_mcp
