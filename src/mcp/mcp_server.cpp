#include <kaizen_mcp/mcp/mcp_server.hpp>

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/mcp/jsonrpc.hpp>

#include <string>

namespace kaizen_mcp {

McpServer::McpServer(const Dispatcher& dispatcher,
                     std::istream& in,
                     std::ostream& out)
    : dispatcher_(dispatcher), reader_(in), writer_(out) {}

Result<void, Error> McpServer::Run() {
    using R = Result<void, Error>;

    while (true) {
        auto frame = reader_.Next();
        if (frame.IsErr()) {
            return R::Err(frame.Error());
        }
        if (!frame.Value().has_value()) {
            LogDebug("server", "end of input");
            return R::Ok();
        }

        auto encoded = HandlePayload(*frame.Value());
        if (!encoded.has_value()) {
            continue;
        }

        auto written = writer_.Write(*encoded);
        if (written.IsErr()) {
            return written;
        }
    }
}

std::optional<std::string> McpServer::HandlePayload(
    std::string_view payload) const {
    auto request = DecodeRequest(payload);
    if (request.IsErr()) {
        LogWarn("server", "dropping invalid json-rpc payload",
                {{"error", request.Error().message}});
        return std::nullopt;
    }

    const auto& req = request.Value();
    LogDebug("server", "request", {{"method", req.method}});

    auto response = dispatcher_.Dispatch(req);
    if (!response.has_value()) {
        return std::nullopt;
    }
    return EncodeResponse(*response);
}

} // namespace kaizen_mcp
