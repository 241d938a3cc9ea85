#include <kaizen_mcp/config/config_loader.hpp>

#include <kaizen_mcp/core/strings.hpp>
#include <kaizen_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace kaizen_mcp {

namespace {

constexpr const char* kEnvBaseUrl = "KAIZEN_API_BASE_URL";
constexpr const char* kEnvLogLevel = "KAIZEN_LOG_LEVEL";
constexpr const char* kEnvLogFormat = "KAIZEN_LOG_FORMAT";
constexpr const char* kEnvConfigPath = "KAIZEN_MCP_CONFIG";

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message,
                 ErrorCategory::Configuration};
}

// Trimmed value of an environment variable; nullopt when unset or blank.
std::optional<std::string> NonBlankEnv(const std::string& name) {
    const char* raw = std::getenv(name.c_str());
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto value = strings::Trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<ApiBaseUrl, Error> ParseBaseUrl(std::string_view raw,
                                       const std::string& source) {
    auto url = ApiBaseUrl::Create(raw);
    if (url.IsErr()) {
        return Result<ApiBaseUrl, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + url.Error()));
    }
    return Result<ApiBaseUrl, Error>::Ok(std::move(url).Value());
}

Result<LogLevel, Error> ParseLevel(std::string_view raw,
                                   const std::string& source) {
    auto level = ParseLogLevel(raw);
    if (!level.has_value()) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            "Invalid " + source + ": '" + std::string(raw) +
            "' (expected debug, info, warn or error)"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

Result<LogFormat, Error> ParseFormat(std::string_view raw,
                                     const std::string& source) {
    auto format = ParseLogFormat(raw);
    if (!format.has_value()) {
        return Result<LogFormat, Error>::Err(MakeConfigError(
            "Invalid " + source + ": '" + std::string(raw) +
            "' (expected json or text)"));
    }
    return Result<LogFormat, Error>::Ok(*format);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      AppConfig base) {
    using R = Result<AppConfig, Error>;

    AppConfig config = std::move(base);
    try {
        const auto root = YAML::LoadFile(std::string(file_path));

        if (const auto api = root["api"]) {
            if (api["base_url"]) {
                auto url = ParseBaseUrl(api["base_url"].as<std::string>(),
                                        "api.base_url");
                if (url.IsErr()) {
                    return R::Err(url.Error());
                }
                config.api.base_url = std::move(url).Value();
            }
            if (api["api_key_env"]) {
                config.api.api_key_env = api["api_key_env"].as<std::string>();
            }
            if (api["timeout_seconds"]) {
                config.api.timeout_seconds = api["timeout_seconds"].as<int>();
            }
            if (api["insecure"]) {
                config.api.disable_tls_verify = api["insecure"].as<bool>();
            }
        }

        if (const auto log = root["log"]) {
            if (log["level"]) {
                auto level = ParseLevel(log["level"].as<std::string>(), "log.level");
                if (level.IsErr()) {
                    return R::Err(level.Error());
                }
                config.log.level = level.Value();
            }
            if (log["format"]) {
                auto format = ParseFormat(log["format"].as<std::string>(), "log.format");
                if (format.IsErr()) {
                    return R::Err(format.Error());
                }
                config.log.format = format.Value();
            }
        }
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Failed to parse YAML file '" +
                                      std::string(file_path) + "': " + e.what()));
    }

    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyEnvironment(AppConfig config) {
    using R = Result<AppConfig, Error>;

    if (auto raw = NonBlankEnv(kEnvBaseUrl)) {
        auto url = ParseBaseUrl(*raw, kEnvBaseUrl);
        if (url.IsErr()) {
            return R::Err(url.Error());
        }
        config.api.base_url = std::move(url).Value();
    }
    if (!config.api.api_key_env.empty()) {
        if (auto key = NonBlankEnv(config.api.api_key_env)) {
            config.api.api_key = *key;
        }
    }
    if (auto raw = NonBlankEnv(kEnvLogLevel)) {
        auto level = ParseLevel(*raw, kEnvLogLevel);
        if (level.IsErr()) {
            return R::Err(level.Error());
        }
        config.log.level = level.Value();
    }
    if (auto raw = NonBlankEnv(kEnvLogFormat)) {
        auto format = ParseFormat(*raw, kEnvLogFormat);
        if (format.IsErr()) {
            return R::Err(format.Error());
        }
        config.log.format = format.Value();
    }

    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion);
    program.add_description(
        "MCP server exposing the Kaizen API tools over stdin/stdout.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file (default: $KAIZEN_MCP_CONFIG)");
    program.add_argument("--base-url")
        .help("Kaizen API base URL (default: $KAIZEN_API_BASE_URL or http://localhost:8080)");
    program.add_argument("--timeout")
        .help("Per tool call timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-format")
        .help("json or text");
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Shorthand for --log-level debug")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.base_url = program.present("--base-url");
    cli.timeout_seconds = program.present<int>("--timeout");
    cli.log_level = program.present("--log-level");
    cli.log_format = program.present("--log-format");
    cli.insecure = program.get<bool>("--insecure");
    cli.verbose = program.get<bool>("--verbose");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyCliOverrides(AppConfig config,
                                           const CliOptions& cli) {
    using R = Result<AppConfig, Error>;

    if (cli.base_url.has_value()) {
        auto url = ParseBaseUrl(*cli.base_url, "--base-url");
        if (url.IsErr()) {
            return R::Err(url.Error());
        }
        config.api.base_url = std::move(url).Value();
    }
    if (cli.timeout_seconds.has_value()) {
        config.api.timeout_seconds = *cli.timeout_seconds;
    }
    if (cli.insecure) {
        config.api.disable_tls_verify = true;
    }
    if (cli.log_level.has_value()) {
        auto level = ParseLevel(*cli.log_level, "--log-level");
        if (level.IsErr()) {
            return R::Err(level.Error());
        }
        config.log.level = level.Value();
    }
    if (cli.verbose) {
        config.log.level = LogLevel::Debug;
    }
    if (cli.log_format.has_value()) {
        auto format = ParseFormat(*cli.log_format, "--log-format");
        if (format.IsErr()) {
            return R::Err(format.Error());
        }
        config.log.format = format.Value();
    }

    return R::Ok(std::move(config));
}

std::optional<std::string> ResolveConfigPath(const CliOptions& cli) {
    if (cli.config_path.has_value()) {
        return cli.config_path;
    }
    return NonBlankEnv(kEnvConfigPath);
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.api.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.api.timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(const CliOptions& cli) {
    using R = Result<AppConfig, Error>;

    AppConfig config;
    if (auto path = ResolveConfigPath(cli)) {
        auto loaded = LoadFromYaml(*path, std::move(config));
        if (loaded.IsErr()) {
            return loaded;
        }
        config = std::move(loaded).Value();
    }

    auto with_env = ApplyEnvironment(std::move(config));
    if (with_env.IsErr()) {
        return with_env;
    }

    auto merged = ApplyCliOverrides(std::move(with_env).Value(), cli);
    if (merged.IsErr()) {
        return merged;
    }

    auto valid = ValidateConfig(merged.Value());
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return merged;
}

} // namespace kaizen_mcp
