#include <kaizen_mcp/mcp/tool_arguments.hpp>

#include <kaizen_mcp/core/strings.hpp>

namespace kaizen_mcp {

namespace json_args {

std::optional<nlohmann::json> Get(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    return *it;
}

std::optional<std::string> GetString(const nlohmann::json& obj, const std::string& key) {
    auto value = Get(obj, key);
    if (!value || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

std::optional<std::string> GetNonBlankString(const nlohmann::json& obj,
                                             const std::string& key) {
    auto value = GetString(obj, key);
    if (!value || strings::Trim(*value).empty()) return std::nullopt;
    return value;
}

} // namespace json_args

namespace {

void PutIfPresent(nlohmann::json& payload, const char* key,
                  const std::optional<nlohmann::json>& value) {
    if (value.has_value()) {
        payload[key] = *value;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// akuma.query
// ---------------------------------------------------------------------------
Result<AkumaQueryArgs, std::string> AkumaQueryArgs::FromJson(const nlohmann::json& args) {
    using R = Result<AkumaQueryArgs, std::string>;

    auto dialect = json_args::GetNonBlankString(args, "dialect");
    if (!dialect) return R::Err("dialect is required");
    auto prompt = json_args::GetNonBlankString(args, "prompt");
    if (!prompt) return R::Err("prompt is required");

    AkumaQueryArgs out;
    out.dialect = std::move(*dialect);
    out.prompt = std::move(*prompt);
    out.mode = json_args::Get(args, "mode");
    out.max_rows = json_args::Get(args, "maxRows");
    out.guardrails = json_args::Get(args, "guardrails");
    return R::Ok(std::move(out));
}

nlohmann::json AkumaQueryArgs::ToPayload() const {
    nlohmann::json payload = {{"dialect", dialect}, {"prompt", prompt}};
    PutIfPresent(payload, "mode", mode);
    PutIfPresent(payload, "maxRows", max_rows);
    PutIfPresent(payload, "guardrails", guardrails);
    return payload;
}

// ---------------------------------------------------------------------------
// akuma.explain
// ---------------------------------------------------------------------------
Result<AkumaExplainArgs, std::string> AkumaExplainArgs::FromJson(const nlohmann::json& args) {
    using R = Result<AkumaExplainArgs, std::string>;

    auto sql = json_args::GetNonBlankString(args, "sql");
    if (!sql) return R::Err("sql is required");
    return R::Ok(AkumaExplainArgs{std::move(*sql)});
}

nlohmann::json AkumaExplainArgs::ToPayload() const {
    return {{"sql", sql}};
}

// ---------------------------------------------------------------------------
// akuma.schema
// ---------------------------------------------------------------------------
Result<AkumaSchemaArgs, std::string> AkumaSchemaArgs::FromJson(const nlohmann::json& args) {
    using R = Result<AkumaSchemaArgs, std::string>;

    auto tables = json_args::Get(args, "tables");
    if (!tables) return R::Err("tables is required");
    return R::Ok(AkumaSchemaArgs{std::move(*tables), json_args::Get(args, "version")});
}

nlohmann::json AkumaSchemaArgs::ToPayload() const {
    nlohmann::json payload = {{"tables", tables}};
    PutIfPresent(payload, "version", version);
    return payload;
}

// ---------------------------------------------------------------------------
// enzan.summary
// ---------------------------------------------------------------------------
Result<EnzanSummaryArgs, std::string> EnzanSummaryArgs::FromJson(const nlohmann::json& args) {
    EnzanSummaryArgs out;
    if (auto window = json_args::Get(args, "window")) {
        out.window = std::move(*window);
    }
    out.group_by = json_args::Get(args, "groupBy");
    return Result<EnzanSummaryArgs, std::string>::Ok(std::move(out));
}

nlohmann::json EnzanSummaryArgs::ToPayload() const {
    nlohmann::json payload = {{"window", window}};
    PutIfPresent(payload, "groupBy", group_by);
    return payload;
}

// ---------------------------------------------------------------------------
// sozo.generate
// ---------------------------------------------------------------------------
Result<SozoGenerateArgs, std::string> SozoGenerateArgs::FromJson(const nlohmann::json& args) {
    using R = Result<SozoGenerateArgs, std::string>;

    auto records = json_args::Get(args, "records");
    if (!records) return R::Err("records is required");

    SozoGenerateArgs out;
    out.records = std::move(*records);
    out.schema = json_args::Get(args, "schema");
    out.schema_name = json_args::Get(args, "schemaName");
    if (!out.schema && !out.schema_name) {
        return R::Err("schema or schemaName is required");
    }
    out.correlations = json_args::Get(args, "correlations");
    out.seed = json_args::Get(args, "seed");
    return R::Ok(std::move(out));
}

nlohmann::json SozoGenerateArgs::ToPayload() const {
    nlohmann::json payload = {{"records", records}};
    PutIfPresent(payload, "schema", schema);
    PutIfPresent(payload, "schemaName", schema_name);
    PutIfPresent(payload, "correlations", correlations);
    PutIfPresent(payload, "seed", seed);
    return payload;
}

} // namespace kaizen_mcp
