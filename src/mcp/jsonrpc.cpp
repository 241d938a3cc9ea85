#include <kaizen_mcp/mcp/jsonrpc.hpp>

namespace kaizen_mcp {

namespace {

constexpr auto kDumpErrors = nlohmann::json::error_handler_t::replace;

Error MakeDecodeError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, ErrorCategory::Decode};
}

std::string Dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, kDumpErrors);
}

nlohmann::json RpcErrorToJson(const RpcError& error) {
    nlohmann::json j = {{"code", error.code}, {"message", error.message}};
    if (error.data.has_value()) {
        j["data"] = *error.data;
    }
    return j;
}

nlohmann::json Parse(std::string_view payload, std::string& error_out) {
    try {
        return nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::parse_error& e) {
        error_out = e.what();
        return nlohmann::json::value_t::discarded;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DecodeRequest
// ---------------------------------------------------------------------------
Result<Request, Error> DecodeRequest(std::string_view payload) {
    using R = Result<Request, Error>;

    std::string parse_error;
    auto j = Parse(payload, parse_error);
    if (j.is_discarded()) {
        return R::Err(MakeDecodeError("DecodeRequest", parse_error));
    }
    if (!j.is_object()) {
        return R::Err(MakeDecodeError(
            "DecodeRequest",
            std::string("request must be a JSON object, got ") + j.type_name()));
    }

    Request request;

    if (auto it = j.find("jsonrpc"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return R::Err(MakeDecodeError("DecodeRequest",
                                          "\"jsonrpc\" must be a string"));
        }
        request.jsonrpc = it->get<std::string>();
    }

    if (auto it = j.find("method"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return R::Err(MakeDecodeError("DecodeRequest",
                                          "\"method\" must be a string"));
        }
        request.method = it->get<std::string>();
    }

    if (auto it = j.find("id"); it != j.end()) {
        request.id = *it;
    }

    if (auto it = j.find("params"); it != j.end()) {
        request.params = *it;
    }

    return R::Ok(std::move(request));
}

// ---------------------------------------------------------------------------
// EncodeResponse
//
// nlohmann::json orders object members by key; the envelope is assembled by
// hand so that it reads {"jsonrpc":..,"id":..,"result"|"error":..}.
// ---------------------------------------------------------------------------
std::string EncodeResponse(const Response& response) {
    std::string out;
    out += R"({"jsonrpc":")";
    out += kJsonRpcVersion;
    out += R"(","id":)";
    out += Dump(response.id);
    if (response.outcome.IsOk()) {
        out += R"(,"result":)";
        out += Dump(response.outcome.Value());
    } else {
        out += R"(,"error":)";
        out += Dump(RpcErrorToJson(response.outcome.Error()));
    }
    out += '}';
    return out;
}

// ---------------------------------------------------------------------------
// DecodeResponse
// ---------------------------------------------------------------------------
Result<Response, Error> DecodeResponse(std::string_view payload) {
    using R = Result<Response, Error>;

    std::string parse_error;
    auto j = Parse(payload, parse_error);
    if (j.is_discarded()) {
        return R::Err(MakeDecodeError("DecodeResponse", parse_error));
    }
    if (!j.is_object()) {
        return R::Err(MakeDecodeError("DecodeResponse",
                                      "response must be a JSON object"));
    }

    nlohmann::json id;
    if (auto it = j.find("id"); it != j.end()) {
        id = *it;
    }
    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (has_result == has_error) {
        return R::Err(MakeDecodeError(
            "DecodeResponse",
            "response must carry exactly one of \"result\" or \"error\""));
    }

    if (has_result) {
        return R::Ok(Response::Success(std::move(id), j["result"]));
    }

    const auto& e = j["error"];
    if (!e.is_object() || !e.contains("code") || !e["code"].is_number_integer() ||
        !e.contains("message") || !e["message"].is_string()) {
        return R::Err(MakeDecodeError("DecodeResponse",
                                      "malformed \"error\" member"));
    }
    RpcError error{e["code"].get<int>(), e["message"].get<std::string>(),
                   std::nullopt};
    if (e.contains("data")) {
        error.data = e["data"];
    }
    return R::Ok(Response::Failure(std::move(id), std::move(error)));
}

} // namespace kaizen_mcp
