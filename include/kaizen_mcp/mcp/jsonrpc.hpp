#pragma once

#include <kaizen_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kaizen_mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";

// Reserved JSON-RPC error codes used by the server.
namespace rpc_code {
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
} // namespace rpc_code

// ---------------------------------------------------------------------------
// Request: one decoded JSON-RPC call.
//
// `id` is nullopt when the member was absent (a notification). An explicit
// "id": null is a present identifier holding a JSON null.
// ---------------------------------------------------------------------------
struct Request {
    std::string jsonrpc;
    std::optional<nlohmann::json> id;
    std::string method;
    nlohmann::json params;  // null when absent

    [[nodiscard]] bool IsNotification() const noexcept { return !id.has_value(); }
};

// ---------------------------------------------------------------------------
// RpcError: JSON-RPC level failure (the call itself was unacceptable).
// ---------------------------------------------------------------------------
struct RpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
};

// ---------------------------------------------------------------------------
// Response: carries exactly one of a result or an RpcError.
// ---------------------------------------------------------------------------
struct Response {
    nlohmann::json id;
    Result<nlohmann::json, RpcError> outcome;

    static Response Success(nlohmann::json id, nlohmann::json result) {
        return Response{std::move(id),
                        Result<nlohmann::json, RpcError>::Ok(std::move(result))};
    }

    static Response Failure(nlohmann::json id, RpcError error) {
        return Response{std::move(id),
                        Result<nlohmann::json, RpcError>::Err(std::move(error))};
    }
};

/// Parse a frame payload into a Request. Fails on invalid JSON, a non-object
/// top level, or a non-string "method"/"jsonrpc".
[[nodiscard]] Result<Request, Error> DecodeRequest(std::string_view payload);

/// Serialize a Response as {"jsonrpc","id","result"|"error"} in that order.
[[nodiscard]] std::string EncodeResponse(const Response& response);

/// Parse an encoded Response back (round-trip checks and diagnostics).
[[nodiscard]] Result<Response, Error> DecodeResponse(std::string_view payload);

} // namespace kaizen_mcp
