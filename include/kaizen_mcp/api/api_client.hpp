#pragma once

#include <kaizen_mcp/api/i_remote_executor.hpp>
#include <kaizen_mcp/core/types.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// ApiClientOptions: settings for the Kaizen API client.
// ---------------------------------------------------------------------------
struct ApiClientOptions {
    std::chrono::seconds connect_timeout{10};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// ApiClient: IRemoteExecutor implementation on top of cpp-httplib.
//
// Uses pimpl so httplib stays out of the public header. Configuration is
// fixed at construction; every Execute() builds its own httplib::Client
// with timeouts derived from the remaining deadline, so the instance can be
// shared by reference for the process lifetime.
//
// Every request carries "Authorization: Bearer <api_key>" and a User-Agent;
// Content-Type is set only when a payload is sent.
// ---------------------------------------------------------------------------
class ApiClient : public IRemoteExecutor {
public:
    ApiClient(ApiBaseUrl base_url,
              std::string api_key,
              const ApiClientOptions& options = {});

    ~ApiClient() override;

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        HttpMethod method,
        std::string_view path,
        const std::optional<nlohmann::json>& payload,
        const Deadline& deadline) override;

    [[nodiscard]] const ApiBaseUrl& BaseUrl() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Turn a raw HTTP status and body into the executor's result.
///   - empty body decodes as {}
///   - a non-empty body must be a JSON object
///   - a non-2xx status becomes Error::FromHttpStatus
[[nodiscard]] Result<nlohmann::json, Error> DecodeApiResponse(
    HttpMethod method,
    std::string_view path,
    int status_code,
    std::string_view body);

} // namespace kaizen_mcp
