#include <catch2/catch_test_macros.hpp>

#include <kaizen_mcp/config/config_loader.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using namespace kaizen_mcp;

namespace {

constexpr const char* kEnvVars[] = {
    "KAIZEN_API_BASE_URL", "KAIZEN_API_KEY", "KAIZEN_TEST_KEY",
    "KAIZEN_LOG_LEVEL",    "KAIZEN_LOG_FORMAT", "KAIZEN_MCP_CONFIG",
};

// Clears every variable the loader reads and restores them on exit.
class ScopedEnv {
public:
    ScopedEnv() {
        for (const char* name : kEnvVars) {
            const char* raw = std::getenv(name);
            saved_.emplace_back(name, raw ? std::optional<std::string>(raw)
                                          : std::nullopt);
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        for (const auto& [name, value] : saved_) {
            if (value.has_value()) {
                setenv(name.c_str(), value->c_str(), 1);
            } else {
                unsetenv(name.c_str());
            }
        }
    }

    void Set(const char* name, const char* value) { setenv(name, value, 1); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

// Tests run from the build directory; derive the testdata path from __FILE__.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));  // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));   // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "kaizen-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.api.base_url.Value() == "https://api.kaizen.dev/gateway");
    CHECK(config.api.base_url.PathPrefix() == "/gateway");
    CHECK(config.api.api_key_env == "KAIZEN_TEST_KEY");
    CHECK(config.api.api_key.empty());
    CHECK(config.api.timeout_seconds == 15);
    CHECK(config.api.disable_tls_verify);
    CHECK(config.log.level == LogLevel::Debug);
    CHECK(config.log.format == LogFormat::Text);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.api.base_url.Value() == "http://127.0.0.1:9000");
    CHECK(config.api.api_key_env == "KAIZEN_API_KEY");
    CHECK(config.api.timeout_seconds == 60);
    CHECK_FALSE(config.api.disable_tls_verify);
    CHECK(config.log.level == LogLevel::Info);
    CHECK(config.log.format == LogFormat::Json);
}

TEST_CASE("LoadFromYaml: values layer on top of base", "[config][yaml]") {
    AppConfig base;
    base.api.timeout_seconds = 5;
    base.log.format = LogFormat::Text;

    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"), base);
    REQUIRE(result.IsOk());
    CHECK(result.Value().api.timeout_seconds == 5);
    CHECK(result.Value().log.format == LogFormat::Text);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("malformed.yaml") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid values are rejected", "[config][yaml]") {
    auto level = LoadFromYaml(TestDataPath("invalid_log_level.yaml"));
    REQUIRE(level.IsErr());
    CHECK(level.Error().message.find("log.level") != std::string::npos);
    CHECK(level.Error().message.find("verbose") != std::string::npos);

    auto url = LoadFromYaml(TestDataPath("invalid_base_url.yaml"));
    REQUIRE(url.IsErr());
    CHECK(url.Error().message.find("api.base_url") != std::string::npos);
}

// ===========================================================================
// ApplyEnvironment
// ===========================================================================

TEST_CASE("ApplyEnvironment: reads base URL, key and logging", "[config][env]") {
    ScopedEnv env;
    env.Set("KAIZEN_API_BASE_URL", "https://kaizen.internal:8443");
    env.Set("KAIZEN_API_KEY", "  sk-test  ");
    env.Set("KAIZEN_LOG_LEVEL", "warn");
    env.Set("KAIZEN_LOG_FORMAT", "text");

    auto result = ApplyEnvironment(AppConfig{});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.api.base_url.Origin() == "https://kaizen.internal:8443");
    CHECK(config.api.api_key == "sk-test");
    CHECK(config.log.level == LogLevel::Warn);
    CHECK(config.log.format == LogFormat::Text);
}

TEST_CASE("ApplyEnvironment: blank variables are ignored", "[config][env]") {
    ScopedEnv env;
    env.Set("KAIZEN_API_BASE_URL", "   ");
    env.Set("KAIZEN_API_KEY", "");

    auto result = ApplyEnvironment(AppConfig{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().api.base_url.Value() == "http://localhost:8080");
    CHECK(result.Value().api.api_key.empty());
}

TEST_CASE("ApplyEnvironment: key comes from the configured variable", "[config][env]") {
    ScopedEnv env;
    env.Set("KAIZEN_API_KEY", "default-key");
    env.Set("KAIZEN_TEST_KEY", "custom-key");

    AppConfig config;
    config.api.api_key_env = "KAIZEN_TEST_KEY";
    auto result = ApplyEnvironment(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().api.api_key == "custom-key");
}

TEST_CASE("ApplyEnvironment: invalid values", "[config][env]") {
    ScopedEnv env;

    SECTION("base URL") {
        env.Set("KAIZEN_API_BASE_URL", "localhost:8080");
        auto result = ApplyEnvironment(AppConfig{});
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("KAIZEN_API_BASE_URL") != std::string::npos);
    }

    SECTION("log level") {
        env.Set("KAIZEN_LOG_LEVEL", "trace");
        auto result = ApplyEnvironment(AppConfig{});
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("KAIZEN_LOG_LEVEL") != std::string::npos);
    }

    SECTION("log format") {
        env.Set("KAIZEN_LOG_FORMAT", "xml");
        auto result = ApplyEnvironment(AppConfig{});
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("KAIZEN_LOG_FORMAT") != std::string::npos);
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.base_url.has_value());
    CHECK_FALSE(cli.timeout_seconds.has_value());
    CHECK_FALSE(cli.log_level.has_value());
    CHECK_FALSE(cli.log_format.has_value());
    CHECK_FALSE(cli.insecure);
    CHECK_FALSE(cli.verbose);
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseArgs({"--config", "/etc/kaizen.yaml",
                             "--base-url", "http://10.0.0.5:8080",
                             "--timeout", "30",
                             "--log-level", "error",
                             "--log-format", "text",
                             "--insecure", "-v"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == "/etc/kaizen.yaml");
    CHECK(cli.base_url == "http://10.0.0.5:8080");
    CHECK(cli.timeout_seconds == 30);
    CHECK(cli.log_level == "error");
    CHECK(cli.log_format == "text");
    CHECK(cli.insecure);
    CHECK(cli.verbose);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    auto result = ParseArgs({"--bogus"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.rfind("CLI parse error: ", 0) == 0);
}

TEST_CASE("LoadFromCli: non-numeric timeout", "[config][cli]") {
    auto result = ParseArgs({"--timeout", "soon"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

// ===========================================================================
// ApplyCliOverrides / ValidateConfig
// ===========================================================================

TEST_CASE("ApplyCliOverrides: flags win", "[config][merge]") {
    AppConfig config;
    config.log.level = LogLevel::Error;

    CliOptions cli;
    cli.base_url = "https://override.kaizen.dev";
    cli.timeout_seconds = 3;
    cli.log_format = "text";
    cli.insecure = true;

    auto result = ApplyCliOverrides(config, cli);
    REQUIRE(result.IsOk());
    CHECK(result.Value().api.base_url.Value() == "https://override.kaizen.dev");
    CHECK(result.Value().api.timeout_seconds == 3);
    CHECK(result.Value().api.disable_tls_verify);
    CHECK(result.Value().log.level == LogLevel::Error);
    CHECK(result.Value().log.format == LogFormat::Text);
}

TEST_CASE("ApplyCliOverrides: verbose beats --log-level", "[config][merge]") {
    CliOptions cli;
    cli.log_level = "warn";
    cli.verbose = true;

    auto result = ApplyCliOverrides(AppConfig{}, cli);
    REQUIRE(result.IsOk());
    CHECK(result.Value().log.level == LogLevel::Debug);
}

TEST_CASE("ApplyCliOverrides: invalid base URL", "[config][merge]") {
    CliOptions cli;
    cli.base_url = "https://user:pw@kaizen.dev";

    auto result = ApplyCliOverrides(AppConfig{}, cli);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--base-url") != std::string::npos);
}

TEST_CASE("ValidateConfig: timeout must be positive", "[config]") {
    AppConfig config;
    CHECK(ValidateConfig(config).IsOk());

    config.api.timeout_seconds = -1;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Timeout must be positive, got -1");
}

// ===========================================================================
// ResolveConfigPath / LoadConfig
// ===========================================================================

TEST_CASE("ResolveConfigPath: flag, then environment", "[config]") {
    ScopedEnv env;
    CliOptions cli;
    CHECK_FALSE(ResolveConfigPath(cli).has_value());

    env.Set("KAIZEN_MCP_CONFIG", "/opt/kaizen/mcp.yaml");
    CHECK(ResolveConfigPath(cli) == "/opt/kaizen/mcp.yaml");

    cli.config_path = "./local.yaml";
    CHECK(ResolveConfigPath(cli) == "./local.yaml");
}

TEST_CASE("LoadConfig: defaults without file, env or flags", "[config]") {
    ScopedEnv env;
    auto result = LoadConfig(CliOptions{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().api.base_url.Value() == "http://localhost:8080");
    CHECK(result.Value().api.api_key.empty());
    CHECK(result.Value().api.timeout_seconds == 60);
}

TEST_CASE("LoadConfig: YAML, then environment, then CLI", "[config]") {
    ScopedEnv env;
    env.Set("KAIZEN_TEST_KEY", "from-env");
    env.Set("KAIZEN_LOG_FORMAT", "json");

    CliOptions cli;
    cli.config_path = TestDataPath("valid_config.yaml");
    cli.timeout_seconds = 90;

    auto result = LoadConfig(cli);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.api.base_url.Value() == "https://api.kaizen.dev/gateway");
    CHECK(config.api.api_key == "from-env");
    CHECK(config.api.timeout_seconds == 90);
    CHECK(config.log.level == LogLevel::Debug);
    CHECK(config.log.format == LogFormat::Json);
}

TEST_CASE("LoadConfig: config path from environment", "[config]") {
    ScopedEnv env;
    env.Set("KAIZEN_MCP_CONFIG", TestDataPath("minimal_config.yaml").c_str());

    auto result = LoadConfig(CliOptions{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().api.base_url.Value() == "http://127.0.0.1:9000");
}

TEST_CASE("LoadConfig: validation runs last", "[config]") {
    ScopedEnv env;
    CliOptions cli;
    cli.config_path = TestDataPath("zero_timeout.yaml");

    auto rejected = LoadConfig(cli);
    REQUIRE(rejected.IsErr());
    CHECK(rejected.Error().message == "Timeout must be positive, got 0");

    cli.timeout_seconds = 10;
    auto fixed = LoadConfig(cli);
    REQUIRE(fixed.IsOk());
    CHECK(fixed.Value().api.timeout_seconds == 10);
}
