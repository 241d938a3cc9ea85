#pragma once

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/core/types.hpp>

#include <string>

namespace kaizen_mcp {

inline constexpr const char* kDefaultApiBaseUrl = "http://localhost:8080";
inline constexpr const char* kDefaultApiKeyEnv = "KAIZEN_API_KEY";

struct ApiConfig {
    ApiBaseUrl base_url = ApiBaseUrl::Create(kDefaultApiBaseUrl).Value();
    std::string api_key;                        // may stay empty
    std::string api_key_env = kDefaultApiKeyEnv; // env var the key is read from
    int timeout_seconds = 60;                   // per tool call
    bool disable_tls_verify = false;
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Json;
};

struct AppConfig {
    ApiConfig api;
    LogConfig log;
};

} // namespace kaizen_mcp
