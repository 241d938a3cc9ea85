#pragma once

#include <kaizen_mcp/config/app_config.hpp>
#include <kaizen_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace kaizen_mcp {

// Flags given on the command line. Unset members leave the config untouched.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> base_url;
    std::optional<int> timeout_seconds;
    std::optional<std::string> log_level;
    std::optional<std::string> log_format;
    bool insecure = false;
    bool verbose = false;
};

// Parse a YAML config file on top of `base`. Missing keys keep their value.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      AppConfig base = {});

// Overlay KAIZEN_API_BASE_URL, the API key variable, KAIZEN_LOG_LEVEL and
// KAIZEN_LOG_FORMAT. Blank variables are ignored.
Result<AppConfig, Error> ApplyEnvironment(AppConfig config);

// Parse CLI arguments. --help and --version print and exit.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// CLI flags take precedence over everything else.
Result<AppConfig, Error> ApplyCliOverrides(AppConfig config,
                                           const CliOptions& cli);

// The YAML file to read: --config, then KAIZEN_MCP_CONFIG, else none.
std::optional<std::string> ResolveConfigPath(const CliOptions& cli);

// Validate values that the layers above cannot check on their own.
Result<void, Error> ValidateConfig(const AppConfig& config);

// defaults -> YAML -> environment -> CLI, then validate.
Result<AppConfig, Error> LoadConfig(const CliOptions& cli);

} // namespace kaizen_mcp
