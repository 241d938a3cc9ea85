#include <kaizen_mcp/mcp/tool_catalog.hpp>

namespace kaizen_mcp {

namespace {

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json TypeProp(const std::string& type) {
    return {{"type", type}};
}

nlohmann::json EnumProp(std::initializer_list<const char*> values) {
    return {{"type", "string"}, {"enum", nlohmann::json::array_t(values.begin(), values.end())}};
}

nlohmann::json ArrayOf(const std::string& item_type) {
    return {{"type", "array"}, {"items", TypeProp(item_type)}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          std::initializer_list<const char*> required = {}) {
    nlohmann::json schema = {{"type", "object"},
                             {"properties", properties},
                             {"additionalProperties", false}};
    if (required.size() > 0) {
        schema["required"] = nlohmann::json::array_t(required.begin(), required.end());
    }
    return schema;
}

std::vector<ToolSchema> BuildDefinitions() {
    std::vector<ToolSchema> tools;
    tools.reserve(kAllToolKinds.size());

    const auto add = [&tools](ToolKind kind, std::string description,
                              nlohmann::json schema) {
        tools.push_back({kind, std::string(ToolName(kind)),
                         std::move(description), std::move(schema)});
    };

    add(ToolKind::AkumaQuery,
        "Translate natural language into SQL (optionally returning rows or explanation).",
        MakeSchema({{"dialect", EnumProp({"postgres", "mysql", "snowflake", "bigquery"})},
                    {"prompt", TypeProp("string")},
                    {"mode", EnumProp({"sql-only", "sql-and-results", "explain"})},
                    {"maxRows", TypeProp("number")},
                    {"guardrails", TypeProp("object")}},
                   {"dialect", "prompt"}));

    add(ToolKind::AkumaExplain,
        "Explain a SQL query in plain English.",
        MakeSchema({{"sql", TypeProp("string")}}, {"sql"}));

    add(ToolKind::AkumaSchema,
        "Set Akuma schema context used for query generation.",
        MakeSchema({{"version", TypeProp("string")},
                    {"tables", ArrayOf("object")}},
                   {"tables"}));

    add(ToolKind::EnzanSummary,
        "Summarize GPU spend and usage for a time window.",
        MakeSchema({{"window", EnumProp({"1h", "24h", "7d", "30d"})},
                    {"groupBy", ArrayOf("string")}}));

    add(ToolKind::EnzanBurn,
        "Get current burn rate in USD/hour.",
        MakeSchema(nlohmann::json::object()));

    add(ToolKind::SozoGenerate,
        "Generate synthetic tabular data from a schema or named preset.",
        MakeSchema({{"records", TypeProp("number")},
                    {"schemaName", TypeProp("string")},
                    {"schema", TypeProp("object")},
                    {"correlations", TypeProp("object")},
                    {"seed", TypeProp("number")}},
                   {"records"}));

    add(ToolKind::SozoSchemas,
        "List built-in Sozo schema presets.",
        MakeSchema(nlohmann::json::object()));

    return tools;
}

} // anonymous namespace

std::string_view ToolName(ToolKind kind) noexcept {
    switch (kind) {
        case ToolKind::AkumaQuery:   return "akuma.query";
        case ToolKind::AkumaExplain: return "akuma.explain";
        case ToolKind::AkumaSchema:  return "akuma.schema";
        case ToolKind::EnzanSummary: return "enzan.summary";
        case ToolKind::EnzanBurn:    return "enzan.burn";
        case ToolKind::SozoGenerate: return "sozo.generate";
        case ToolKind::SozoSchemas:  return "sozo.schemas";
    }
    return "";
}

std::optional<ToolKind> ParseToolKind(std::string_view name) {
    for (auto kind : kAllToolKinds) {
        if (ToolName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

const std::vector<ToolSchema>& ToolDefinitions() {
    static const std::vector<ToolSchema> definitions = BuildDefinitions();
    return definitions;
}

} // namespace kaizen_mcp
