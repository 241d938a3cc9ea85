#include <kaizen_mcp/mcp/dispatcher.hpp>

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/core/version.hpp>

#include <string>

namespace kaizen_mcp {

namespace {

using RouteResult = Result<nlohmann::json, RpcError>;

bool IsInitializedNotification(const std::string& method) {
    return method == "notifications/initialized" || method == "initialized";
}

RpcError InvalidToolCall(const std::string& reason) {
    return RpcError{rpc_code::kInvalidParams, "invalid tool call params", reason};
}

} // anonymous namespace

std::optional<Response> Dispatcher::Dispatch(const Request& request) const {
    if (IsInitializedNotification(request.method)) {
        LogDebug("dispatch", "client initialized");
        return std::nullopt;
    }

    auto outcome = Route(request);
    if (request.IsNotification()) {
        return std::nullopt;
    }
    return Response{*request.id, std::move(outcome)};
}

RouteResult Dispatcher::Route(const Request& request) const {
    const auto& method = request.method;
    if (method == "initialize") {
        return RouteResult::Ok(HandleInitialize());
    }
    if (method == "ping") {
        return RouteResult::Ok(nlohmann::json::object());
    }
    if (method == "tools/list") {
        return RouteResult::Ok(HandleToolsList());
    }
    if (method == "tools/call") {
        return HandleToolsCall(request.params);
    }

    LogDebug("dispatch", "method not found", {{"method", method}});
    return RouteResult::Err(
        RpcError{rpc_code::kMethodNotFound, "method not found", method});
}

nlohmann::json Dispatcher::HandleInitialize() const {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", kVersion}}},
    };
}

nlohmann::json Dispatcher::HandleToolsList() const {
    auto tools = nlohmann::json::array();
    for (const auto& schema : registry_.Tools()) {
        tools.push_back(schema.ToJson());
    }
    return {{"tools", std::move(tools)}};
}

RouteResult Dispatcher::HandleToolsCall(const nlohmann::json& params) const {
    // Null or absent params decode as an empty call and fall through to
    // "unknown tool" with an empty name.
    if (!params.is_object() && !params.is_null()) {
        return RouteResult::Err(InvalidToolCall(
            std::string("params must be an object or null, got ") + params.type_name()));
    }

    std::string name;
    auto name_it = params.find("name");
    if (name_it != params.end()) {
        if (!name_it->is_string()) {
            return RouteResult::Err(InvalidToolCall(
                std::string("name must be a string, got ") + name_it->type_name()));
        }
        name = name_it->get<std::string>();
    }

    auto arguments = nlohmann::json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return RouteResult::Err(InvalidToolCall(
                std::string("arguments must be an object, got ") +
                args_it->type_name()));
        }
        arguments = *args_it;
    }

    auto kind = ParseToolKind(name);
    if (!kind.has_value()) {
        LogWarn("dispatch", "unknown tool", {{"tool", name}});
        return RouteResult::Err(
            RpcError{rpc_code::kInvalidParams, "unknown tool", name});
    }

    return RouteResult::Ok(registry_.Execute(*kind, arguments).ToJson());
}

} // namespace kaizen_mcp
