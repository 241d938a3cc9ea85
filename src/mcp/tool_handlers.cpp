#include <kaizen_mcp/mcp/tool_handlers.hpp>

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/mcp/tool_arguments.hpp>

#include <string>

namespace kaizen_mcp {

namespace {

constexpr auto kDumpErrors = nlohmann::json::error_handler_t::replace;

nlohmann::json TextBlock(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

ToolResult FromExecutor(const Result<nlohmann::json, Error>& result) {
    if (result.IsErr()) {
        const auto& error = result.Error();
        LogWarn("tools", "remote operation failed",
                {{"operation", error.operation},
                 {"endpoint", error.endpoint},
                 {"category", error.CategoryName()},
                 {"error", error.message}});
        return ToolResult::Failure(error.ToString());
    }
    return ToolResult::Success(result.Value());
}

// Decode Args, then POST its payload to `path`.
template <typename Args>
ToolResult PostWithArgs(ServerContext& ctx, const nlohmann::json& args,
                        const char* path, const Deadline& deadline) {
    auto decoded = Args::FromJson(args);
    if (decoded.IsErr()) {
        return ToolResult::Failure(decoded.Error());
    }
    return FromExecutor(ctx.executor.Execute(
        HttpMethod::Post, path, decoded.Value().ToPayload(), deadline));
}

ToolResult GetWithoutArgs(ServerContext& ctx, const char* path,
                          const Deadline& deadline) {
    return FromExecutor(
        ctx.executor.Execute(HttpMethod::Get, path, std::nullopt, deadline));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolResult
// ---------------------------------------------------------------------------
ToolResult ToolResult::Success(const nlohmann::json& data) {
    ToolResult result;
    result.content.push_back(TextBlock(data.dump(2, ' ', false, kDumpErrors)));
    result.structured_content = data;
    return result;
}

ToolResult ToolResult::Failure(const std::string& message) {
    ToolResult result;
    result.is_error = true;
    result.content.push_back(TextBlock(message));
    return result;
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json j = {{"content", content}};
    if (is_error) {
        j["isError"] = true;
    }
    if (structured_content.has_value()) {
        j["structuredContent"] = *structured_content;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

ToolResult HandleAkumaQuery(ServerContext& ctx, const nlohmann::json& args,
                            const Deadline& deadline) {
    return PostWithArgs<AkumaQueryArgs>(ctx, args, "/v1/akuma/query", deadline);
}

ToolResult HandleAkumaExplain(ServerContext& ctx, const nlohmann::json& args,
                              const Deadline& deadline) {
    return PostWithArgs<AkumaExplainArgs>(ctx, args, "/v1/akuma/explain", deadline);
}

ToolResult HandleAkumaSchema(ServerContext& ctx, const nlohmann::json& args,
                             const Deadline& deadline) {
    return PostWithArgs<AkumaSchemaArgs>(ctx, args, "/v1/akuma/schema", deadline);
}

ToolResult HandleEnzanSummary(ServerContext& ctx, const nlohmann::json& args,
                              const Deadline& deadline) {
    return PostWithArgs<EnzanSummaryArgs>(ctx, args, "/v1/enzan/summary", deadline);
}

// enzan.burn takes no arguments; anything sent is ignored.
ToolResult HandleEnzanBurn(ServerContext& ctx, const nlohmann::json& /*args*/,
                           const Deadline& deadline) {
    return GetWithoutArgs(ctx, "/v1/enzan/burn", deadline);
}

ToolResult HandleSozoGenerate(ServerContext& ctx, const nlohmann::json& args,
                              const Deadline& deadline) {
    return PostWithArgs<SozoGenerateArgs>(ctx, args, "/v1/sozo/generate", deadline);
}

ToolResult HandleSozoSchemas(ServerContext& ctx, const nlohmann::json& /*args*/,
                             const Deadline& deadline) {
    return GetWithoutArgs(ctx, "/v1/sozo/schemas", deadline);
}

} // namespace kaizen_mcp
