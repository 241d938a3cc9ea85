#include <kaizen_mcp/api/api_client.hpp>

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/core/strings.hpp>
#include <kaizen_mcp/core/version.hpp>

#include <httplib.h>

#include <algorithm>
#include <chrono>

namespace kaizen_mcp {

namespace {

constexpr const char* kApiKeyMissing = "KAIZEN_API_KEY is not set";
constexpr const char* kJsonContentType = "application/json";

Error MakeClientError(HttpMethod method,
                      std::string_view path,
                      const std::string& message,
                      ErrorCategory category) {
    return Error{HttpMethodName(method), std::string(path), std::nullopt,
                 message, category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

bool IsSuccessStatus(int status_code) {
    return status_code >= 200 && status_code < 300;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DecodeApiResponse
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> DecodeApiResponse(HttpMethod method,
                                                std::string_view path,
                                                int status_code,
                                                std::string_view body) {
    using R = Result<nlohmann::json, Error>;

    if (!IsSuccessStatus(status_code)) {
        return R::Err(Error::FromHttpStatus(HttpMethodName(method),
                                            std::string(path), status_code,
                                            body));
    }

    if (strings::Trim(body).empty()) {
        return R::Ok(nlohmann::json::object());
    }

    auto decoded = nlohmann::json::parse(body.begin(), body.end(), nullptr,
                                         /*allow_exceptions=*/false);
    if (decoded.is_discarded()) {
        return R::Err(Error{HttpMethodName(method), std::string(path),
                            status_code, "failed to decode response",
                            ErrorCategory::Decode});
    }
    if (!decoded.is_object()) {
        return R::Err(Error{HttpMethodName(method), std::string(path),
                            status_code,
                            std::string("failed to decode response: expected "
                                        "a JSON object, got ") +
                                decoded.type_name(),
                            ErrorCategory::Decode});
    }
    return R::Ok(std::move(decoded));
}

// ---------------------------------------------------------------------------
// Impl: immutable client configuration.
// ---------------------------------------------------------------------------
struct ApiClient::Impl {
    ApiBaseUrl base_url;
    std::string api_key;
    ApiClientOptions options;
    std::string user_agent;

    Impl(ApiBaseUrl url, std::string key, const ApiClientOptions& opts)
        : base_url(std::move(url)),
          api_key(std::move(key)),
          options(opts),
          user_agent(std::string(kServerName) + "/" + kVersion) {}

    // Fresh client per call: the deadline decides the timeouts. Per-socket
    // timeouts bound each wait; the max timeout bounds the whole request.
    // Both are rounded up so that they never fire before the deadline.
    std::unique_ptr<httplib::Client> MakeClient(const Deadline& deadline) const {
        auto client = std::make_unique<httplib::Client>(base_url.Origin());
        const auto remaining = std::max(
            std::chrono::ceil<std::chrono::milliseconds>(
                deadline.When() - DeadlineClock::now()),
            std::chrono::milliseconds{1});
        const auto connect = std::min<std::chrono::milliseconds>(
            remaining, options.connect_timeout);
        client->set_connection_timeout(connect);
        client->set_read_timeout(remaining);
        client->set_write_timeout(remaining);
        client->set_max_timeout(remaining);
        client->set_bearer_token_auth(api_key);
        if (base_url.IsHttps() && options.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
        return client;
    }

    httplib::Headers RequestHeaders() const {
        return httplib::Headers{
            {"User-Agent", user_agent},
            {"Accept", kJsonContentType},
        };
    }
};

// ---------------------------------------------------------------------------
// ApiClient
// ---------------------------------------------------------------------------
ApiClient::ApiClient(ApiBaseUrl base_url,
                     std::string api_key,
                     const ApiClientOptions& options)
    : impl_(std::make_unique<Impl>(std::move(base_url), std::move(api_key),
                                   options)) {}

ApiClient::~ApiClient() = default;

const ApiBaseUrl& ApiClient::BaseUrl() const noexcept {
    return impl_->base_url;
}

Result<nlohmann::json, Error> ApiClient::Execute(
    HttpMethod method,
    std::string_view path,
    const std::optional<nlohmann::json>& payload,
    const Deadline& deadline) {
    using R = Result<nlohmann::json, Error>;

    if (strings::Trim(impl_->api_key).empty()) {
        return R::Err(MakeClientError(method, path, kApiKeyMissing,
                                      ErrorCategory::Authentication));
    }
    if (deadline.Expired()) {
        return R::Err(MakeClientError(method, path,
                                      "deadline exceeded before request was sent",
                                      ErrorCategory::Timeout));
    }

    const auto full_path = impl_->base_url.PathPrefix() + std::string(path);
    auto client = impl_->MakeClient(deadline);
    auto headers = impl_->RequestHeaders();

    LogDebug("http", std::string(HttpMethodName(method)) + " " + full_path,
             {{"timeout_ms", std::to_string(deadline.Remaining().count())}});

    const auto send = [&]() -> httplib::Result {
        switch (method) {
            case HttpMethod::Get:
                return client->Get(full_path, headers);
            case HttpMethod::Post:
                break;
        }
        if (!payload.has_value()) {
            return client->Post(full_path, headers, std::string(), "");
        }
        return client->Post(full_path, headers,
                            payload->dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace),
                            kJsonContentType);
    };

    auto res = send();
    if (!res) {
        const auto http_error = res.error();
        if (deadline.Expired()) {
            return R::Err(MakeClientError(method, path,
                                          "request timed out: deadline exceeded",
                                          ErrorCategory::Timeout));
        }
        return R::Err(MakeClientError(
            method, path, "request failed: " + httplib::to_string(http_error),
            CategoryFromHttpTransportError(http_error)));
    }

    LogDebug("http", "  < " + std::to_string(res->status),
             {{"path", full_path}, {"bytes", std::to_string(res->body.size())}});

    return DecodeApiResponse(method, path, res->status, res->body);
}

} // namespace kaizen_mcp
