#include <kaizen_mcp/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace kaizen_mcp {

namespace {

bool IsHostChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
           c == '.' || c == '_';
}

uint16_t DefaultPort(std::string_view scheme) {
    return scheme == "https" ? 443 : 80;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ApiBaseUrl
// ---------------------------------------------------------------------------
Result<ApiBaseUrl, std::string> ApiBaseUrl::Create(std::string_view url) {
    using R = Result<ApiBaseUrl, std::string>;

    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    if (url.empty()) {
        return R::Err("API base URL must not be empty");
    }

    std::string scheme;
    std::string_view rest;
    if (url.substr(0, 7) == "http://") {
        scheme = "http";
        rest = url.substr(7);
    } else if (url.substr(0, 8) == "https://") {
        scheme = "https";
        rest = url.substr(8);
    } else {
        return R::Err("API base URL must start with http:// or https://");
    }

    const auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    std::string path_prefix =
        slash == std::string_view::npos ? "" : std::string(rest.substr(slash));

    if (authority.empty()) {
        return R::Err("API base URL must have a host");
    }
    if (authority.find('@') != std::string_view::npos) {
        return R::Err("API base URL must not embed credentials");
    }

    uint16_t port = DefaultPort(scheme);
    auto host = authority;
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        auto port_str = authority.substr(colon + 1);
        unsigned int parsed = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(),
                                         port_str.data() + port_str.size(),
                                         parsed);
        if (port_str.empty() || ec != std::errc{} ||
            ptr != port_str.data() + port_str.size() ||
            parsed == 0 || parsed > 65535) {
            return R::Err("API base URL has an invalid port: '" +
                          std::string(port_str) + "'");
        }
        port = static_cast<uint16_t>(parsed);
    }

    if (host.empty() || !std::all_of(host.begin(), host.end(), IsHostChar)) {
        return R::Err("API base URL has an invalid host: '" +
                      std::string(host) + "'");
    }

    return R::Ok(ApiBaseUrl(std::string(url), std::move(scheme),
                            std::string(host), port, std::move(path_prefix)));
}

std::string ApiBaseUrl::Origin() const {
    return scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

} // namespace kaizen_mcp
