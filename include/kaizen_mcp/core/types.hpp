#pragma once

#include <kaizen_mcp/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// ApiBaseUrl: validated base URL of the Kaizen API.
//
// Rules:
//   - scheme is http:// or https://
//   - non-empty host, optional :port (1-65535)
//   - optional path prefix; trailing '/' characters are trimmed
//
// Value() returns the normalised URL; Origin() is what an HTTP client
// connects to and PathPrefix() is prepended to every request path.
// ---------------------------------------------------------------------------
class ApiBaseUrl {
public:
    static Result<ApiBaseUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] const std::string& PathPrefix() const noexcept { return path_prefix_; }
    [[nodiscard]] bool IsHttps() const noexcept { return scheme_ == "https"; }

    /// scheme://host:port
    [[nodiscard]] std::string Origin() const;

    bool operator==(const ApiBaseUrl& other) const { return value_ == other.value_; }
    bool operator!=(const ApiBaseUrl& other) const { return value_ != other.value_; }

private:
    ApiBaseUrl(std::string value, std::string scheme, std::string host,
               uint16_t port, std::string path_prefix)
        : value_(std::move(value)), scheme_(std::move(scheme)),
          host_(std::move(host)), port_(port),
          path_prefix_(std::move(path_prefix)) {}

    std::string value_;
    std::string scheme_;
    std::string host_;
    uint16_t port_ = 0;
    std::string path_prefix_;
};

// ---------------------------------------------------------------------------
// Deadline: absolute wall-clock bound for one tool invocation.
// ---------------------------------------------------------------------------
using DeadlineClock = std::chrono::steady_clock;

class Deadline {
public:
    static Deadline After(std::chrono::milliseconds budget) {
        return Deadline(DeadlineClock::now() + budget);
    }
    static Deadline At(DeadlineClock::time_point when) { return Deadline(when); }

    [[nodiscard]] DeadlineClock::time_point When() const noexcept { return when_; }

    [[nodiscard]] bool Expired() const { return DeadlineClock::now() >= when_; }

    /// Time left, clamped at zero.
    [[nodiscard]] std::chrono::milliseconds Remaining() const {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            when_ - DeadlineClock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

private:
    explicit Deadline(DeadlineClock::time_point when) : when_(when) {}

    DeadlineClock::time_point when_;
};

} // namespace kaizen_mcp
