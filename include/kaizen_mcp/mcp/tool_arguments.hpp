#pragma once

#include <kaizen_mcp/core/result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// Per-tool argument contracts.
//
// Each struct is decoded on demand from the generic "arguments" object of a
// tools/call request. FromJson() returns the human-readable validation
// message on failure; ToPayload() builds the Kaizen API request body.
// Optional members hold whatever JSON the caller sent and are forwarded
// untouched.
// ---------------------------------------------------------------------------

struct AkumaQueryArgs {
    std::string dialect;
    std::string prompt;
    std::optional<nlohmann::json> mode;
    std::optional<nlohmann::json> max_rows;
    std::optional<nlohmann::json> guardrails;

    static Result<AkumaQueryArgs, std::string> FromJson(const nlohmann::json& args);
    [[nodiscard]] nlohmann::json ToPayload() const;
};

struct AkumaExplainArgs {
    std::string sql;

    static Result<AkumaExplainArgs, std::string> FromJson(const nlohmann::json& args);
    [[nodiscard]] nlohmann::json ToPayload() const;
};

struct AkumaSchemaArgs {
    nlohmann::json tables;
    std::optional<nlohmann::json> version;

    static Result<AkumaSchemaArgs, std::string> FromJson(const nlohmann::json& args);
    [[nodiscard]] nlohmann::json ToPayload() const;
};

struct EnzanSummaryArgs {
    nlohmann::json window = "24h";
    std::optional<nlohmann::json> group_by;

    static Result<EnzanSummaryArgs, std::string> FromJson(const nlohmann::json& args);
    [[nodiscard]] nlohmann::json ToPayload() const;
};

struct SozoGenerateArgs {
    nlohmann::json records;
    std::optional<nlohmann::json> schema;
    std::optional<nlohmann::json> schema_name;
    std::optional<nlohmann::json> correlations;
    std::optional<nlohmann::json> seed;

    static Result<SozoGenerateArgs, std::string> FromJson(const nlohmann::json& args);
    [[nodiscard]] nlohmann::json ToPayload() const;
};

// ---------------------------------------------------------------------------
// Type-checked accessors over a JSON object. They return nullopt on a
// missing member or a type mismatch instead of throwing.
// ---------------------------------------------------------------------------
namespace json_args {

/// Member value regardless of type (a present JSON null counts as present).
std::optional<nlohmann::json> Get(const nlohmann::json& obj, const std::string& key);

/// String member; nullopt when absent or not a string.
std::optional<std::string> GetString(const nlohmann::json& obj, const std::string& key);

/// String member that is non-blank after trimming whitespace.
std::optional<std::string> GetNonBlankString(const nlohmann::json& obj,
                                             const std::string& key);

} // namespace json_args

} // namespace kaizen_mcp
