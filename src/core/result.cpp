#include <kaizen_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace kaizen_mcp {

namespace {

constexpr const char* kDefaultApiFailure = "Kaizen API request failed";

// The Kaizen API reports failures as {"error": "<text>"}. Anything else
// (HTML from a proxy, an empty body, a non-string member) yields nullopt.
std::optional<std::string> ExtractApiError(std::string_view body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body.begin(), body.end(), nullptr,
                                        /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto it = parsed.find("error");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;

    auto msg = it->get<std::string>();
    if (msg.empty()) return std::nullopt;
    return msg;
}

ErrorCategory CategoryFromStatus(int status_code) {
    switch (status_code) {
        case 401:
        case 403:
            return ErrorCategory::Authentication;
        case 404:
            return ErrorCategory::NotFound;
        case 408:
        case 504:
            return ErrorCategory::Timeout;
        case 429:
            return ErrorCategory::RateLimited;
        case 502:
        case 503:
            return ErrorCategory::Connection;
        default:
            return ErrorCategory::Remote;
    }
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            std::string_view response_body) {
    auto api_error = ExtractApiError(response_body);
    return Error{operation,
                 endpoint,
                 status_code,
                 api_error.value_or(kDefaultApiFailure),
                 CategoryFromStatus(status_code)};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << ' ' << endpoint;
    }
    if (http_status.has_value()) {
        oss << " (status=" << *http_status << ")";
    }
    oss << ": " << message;
    return oss.str();
}

} // namespace kaizen_mcp
