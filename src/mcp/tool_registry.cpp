#include <kaizen_mcp/mcp/tool_registry.hpp>

#include <kaizen_mcp/core/log.hpp>

#include <exception>
#include <string>

namespace kaizen_mcp {

namespace {

ToolResult Invoke(ToolKind kind, ServerContext& ctx,
                  const nlohmann::json& args, const Deadline& deadline) {
    switch (kind) {
        case ToolKind::AkumaQuery:
            return HandleAkumaQuery(ctx, args, deadline);
        case ToolKind::AkumaExplain:
            return HandleAkumaExplain(ctx, args, deadline);
        case ToolKind::AkumaSchema:
            return HandleAkumaSchema(ctx, args, deadline);
        case ToolKind::EnzanSummary:
            return HandleEnzanSummary(ctx, args, deadline);
        case ToolKind::EnzanBurn:
            return HandleEnzanBurn(ctx, args, deadline);
        case ToolKind::SozoGenerate:
            return HandleSozoGenerate(ctx, args, deadline);
        case ToolKind::SozoSchemas:
            return HandleSozoSchemas(ctx, args, deadline);
    }
    return ToolResult::Failure("unsupported tool");
}

} // anonymous namespace

const std::vector<ToolSchema>& ToolRegistry::Tools() const noexcept {
    return ToolDefinitions();
}

ToolResult ToolRegistry::Execute(ToolKind kind,
                                 const nlohmann::json& arguments) const {
    const auto deadline = Deadline::After(ctx_.call_timeout);
    const std::string name(ToolName(kind));
    LogDebug("tools", "calling tool", {{"tool", name}});

    try {
        return Invoke(kind, ctx_, arguments, deadline);
    } catch (const std::exception& e) {
        LogError("tools", "tool handler threw", {{"tool", name}, {"error", e.what()}});
        return ToolResult::Failure(std::string("tool error: ") + e.what());
    }
}

} // namespace kaizen_mcp
