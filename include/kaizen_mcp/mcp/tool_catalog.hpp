#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// ToolKind: the closed set of tools this server exposes.
// ---------------------------------------------------------------------------
enum class ToolKind {
    AkumaQuery,     // natural language -> SQL
    AkumaExplain,   // SQL -> plain English
    AkumaSchema,    // set schema context for query generation
    EnzanSummary,   // GPU spend/usage summary
    EnzanBurn,      // current burn rate
    SozoGenerate,   // synthetic tabular data
    SozoSchemas,    // built-in Sozo schema presets
};

inline constexpr std::array<ToolKind, 7> kAllToolKinds = {
    ToolKind::AkumaQuery,   ToolKind::AkumaExplain, ToolKind::AkumaSchema,
    ToolKind::EnzanSummary, ToolKind::EnzanBurn,    ToolKind::SozoGenerate,
    ToolKind::SozoSchemas,
};

/// Wire name, e.g. "akuma.query".
[[nodiscard]] std::string_view ToolName(ToolKind kind) noexcept;

/// Inverse of ToolName; nullopt for names outside the closed set.
[[nodiscard]] std::optional<ToolKind> ParseToolKind(std::string_view name);

// ---------------------------------------------------------------------------
// ToolSchema: name, description and JSON Schema of a tool's input.
// ---------------------------------------------------------------------------
struct ToolSchema {
    ToolKind kind;
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"name", name},
                {"description", description},
                {"inputSchema", input_schema}};
    }
};

/// Static catalog in kAllToolKinds order. Built once, never mutated.
[[nodiscard]] const std::vector<ToolSchema>& ToolDefinitions();

} // namespace kaizen_mcp
