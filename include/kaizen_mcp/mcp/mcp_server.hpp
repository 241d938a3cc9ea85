#pragma once

#include <kaizen_mcp/core/result.hpp>
#include <kaizen_mcp/mcp/dispatcher.hpp>
#include <kaizen_mcp/mcp/framing.hpp>

#include <iostream>
#include <optional>
#include <string_view>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over a pair of streams.
//
// Reads one frame at a time, decodes it, dispatches it and writes the
// response (if any) Content-Length framed. Strictly sequential: a request is
// answered before the next frame is read.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(const Dispatcher& dispatcher,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Blocks until end of input (Ok) or a framing/write failure (Err).
    [[nodiscard]] Result<void, Error> Run();

    // Decode and dispatch one payload. Returns the encoded response, or
    // nullopt when nothing is to be written (notification or undecodable
    // payload).
    [[nodiscard]] std::optional<std::string> HandlePayload(
        std::string_view payload) const;

private:
    const Dispatcher& dispatcher_;
    FrameReader reader_;
    FrameWriter writer_;
};

} // namespace kaizen_mcp
