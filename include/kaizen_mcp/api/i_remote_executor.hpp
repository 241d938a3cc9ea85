#pragma once

#include <kaizen_mcp/core/result.hpp>
#include <kaizen_mcp/core/types.hpp>

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

enum class HttpMethod {
    Get,
    Post,
};

inline const char* HttpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "GET";
}

// ---------------------------------------------------------------------------
// IRemoteExecutor: performs one named operation against the Kaizen API.
//
// Tool handlers depend on this interface rather than a concrete HTTP client,
// which keeps them testable offline via MockRemoteExecutor.
//
// Execute() returns the decoded JSON object on success. Missing credentials,
// transport failures, non-2xx statuses, undecodable bodies and an expired
// deadline all come back as Err, never as exceptions.
// ---------------------------------------------------------------------------
class IRemoteExecutor {
public:
    virtual ~IRemoteExecutor() = default;

    IRemoteExecutor(const IRemoteExecutor&) = delete;
    IRemoteExecutor& operator=(const IRemoteExecutor&) = delete;
    IRemoteExecutor(IRemoteExecutor&&) = delete;
    IRemoteExecutor& operator=(IRemoteExecutor&&) = delete;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Execute(
        HttpMethod method,
        std::string_view path,
        const std::optional<nlohmann::json>& payload,
        const Deadline& deadline) = 0;

protected:
    IRemoteExecutor() = default;
};

} // namespace kaizen_mcp
