#include <catch2/catch_test_macros.hpp>

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/mcp/mcp_server.hpp>

#include "../mocks/mock_remote_executor.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace kaizen_mcp;
using namespace kaizen_mcp::testing;
using nlohmann::json;

namespace {

std::string Framed(const std::string& body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

struct Harness {
    MockRemoteExecutor mock;
    ServerContext ctx{mock};
    ToolRegistry registry{ctx};
    Dispatcher dispatcher{registry};
    std::istringstream in;
    std::ostringstream out;

    explicit Harness(const std::string& input) : in(input) {}

    Result<void, Error> Run() {
        McpServer server(dispatcher, in, out);
        return server.Run();
    }

    // Parse everything written to `out` back into frames.
    std::vector<std::string> Frames() const {
        std::istringstream written(out.str());
        FrameReader reader(written);
        std::vector<std::string> frames;
        while (true) {
            auto next = reader.Next();
            REQUIRE(next.IsOk());
            if (!next.Value().has_value()) {
                return frames;
            }
            frames.push_back(*next.Value());
        }
    }
};

// Captures warnings emitted by the server loop.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& messages) : messages_(messages) {}
    void Write(LogLevel, std::string_view, std::string_view message,
               const LogFields&) override {
        messages_.emplace_back(message);
    }

private:
    std::vector<std::string>& messages_;
};

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view,
               const LogFields&) override {}
};

// Routes the global logger into `messages` for the lifetime of the guard.
struct ScopedLogCapture {
    ScopedLogCapture(std::vector<std::string>& messages, LogLevel level) {
        InitGlobalLogger(std::make_unique<CaptureSink>(messages), level);
    }
    ~ScopedLogCapture() {
        InitGlobalLogger(std::make_unique<DiscardSink>(), LogLevel::Error);
    }
};

} // anonymous namespace

// ===========================================================================
// End-to-end scenarios
// ===========================================================================

TEST_CASE("McpServer: line-delimited ping", "[mcp][server]") {
    Harness h("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");

    REQUIRE(h.Run().IsOk());

    const std::string expected = R"({"jsonrpc":"2.0","id":1,"result":{}})";
    CHECK(h.out.str() == Framed(expected));
}

TEST_CASE("McpServer: tool call missing prompt yields a tool failure", "[mcp][server]") {
    Harness h(Framed(
        R"({"id":2,"method":"tools/call","params":{"name":"akuma.query","arguments":{"dialect":"postgres"}}})"));

    REQUIRE(h.Run().IsOk());

    auto frames = h.Frames();
    REQUIRE(frames.size() == 1);
    auto response = json::parse(frames[0]);
    CHECK(response["id"] == 2);
    CHECK_FALSE(response.contains("error"));
    CHECK(response["result"]["isError"] == true);
    CHECK(response["result"]["content"][0]["text"] == "prompt is required");
    CHECK(h.mock.CallCount() == 0);
}

TEST_CASE("McpServer: bad Content-Length stops the loop with an error", "[mcp][server]") {
    Harness h("Content-Length: nope\r\n\r\n{\"id\":3,\"method\":\"ping\"}\n");

    auto result = h.Run();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Framing);
    CHECK(h.out.str().empty());
}

TEST_CASE("McpServer: invalid JSON is dropped and the loop continues", "[mcp][server]") {
    std::vector<std::string> logged;
    ScopedLogCapture capture(logged, LogLevel::Warn);

    Harness h("{not json}\n{\"id\":4,\"method\":\"ping\"}\n");
    REQUIRE(h.Run().IsOk());

    auto frames = h.Frames();
    REQUIRE(frames.size() == 1);
    CHECK(json::parse(frames[0])["id"] == 4);
    REQUIRE(logged.size() == 1);
    CHECK(logged[0] == "dropping invalid json-rpc payload");
}

TEST_CASE("McpServer: typical session", "[mcp][server]") {
    std::string input;
    input += Framed(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");
    input += Framed(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    input += Framed(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    input += Framed(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"enzan.burn"}})");
    input += Framed(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"enzan.cost"}})");
    input += Framed(R"({"jsonrpc":"2.0","id":5,"method":"shutdown"})");

    Harness h(input);
    h.mock.Enqueue(Result<json, Error>::Ok({{"usdPerHour", 4.25}}));

    REQUIRE(h.Run().IsOk());

    auto frames = h.Frames();
    REQUIRE(frames.size() == 5);

    auto init = json::parse(frames[0]);
    CHECK(init["id"] == 1);
    CHECK(init["result"]["serverInfo"]["name"] == "kaizen-mcp");

    auto list = json::parse(frames[1]);
    CHECK(list["id"] == 2);
    CHECK(list["result"]["tools"].size() == 7);

    auto call = json::parse(frames[2]);
    CHECK(call["id"] == 3);
    CHECK(call["result"]["structuredContent"]["usdPerHour"] == 4.25);

    auto unknown = json::parse(frames[3]);
    CHECK(unknown["id"] == 4);
    CHECK(unknown["error"]["code"] == -32602);
    CHECK(unknown["error"]["data"] == "enzan.cost");

    auto missing = json::parse(frames[4]);
    CHECK(missing["id"] == 5);
    CHECK(missing["error"]["code"] == -32601);
    CHECK(missing["error"]["data"] == "shutdown");
}

TEST_CASE("McpServer: notifications produce no output", "[mcp][server]") {
    Harness h(
        "{\"method\":\"ping\"}\n"
        "{\"method\":\"does/not/exist\"}\n"
        "{\"method\":\"tools/call\",\"params\":{\"name\":\"nope\"}}\n");

    REQUIRE(h.Run().IsOk());
    CHECK(h.out.str().empty());
}

TEST_CASE("McpServer: responses keep request order", "[mcp][server]") {
    Harness h("{\"id\":\"a\",\"method\":\"ping\"}\n{\"id\":\"b\",\"method\":\"ping\"}\n");
    REQUIRE(h.Run().IsOk());

    auto frames = h.Frames();
    REQUIRE(frames.size() == 2);
    CHECK(json::parse(frames[0])["id"] == "a");
    CHECK(json::parse(frames[1])["id"] == "b");
}

TEST_CASE("McpServer: HandlePayload decodes and encodes one message", "[mcp][server]") {
    Harness h("");
    McpServer server(h.dispatcher, h.in, h.out);

    auto encoded = server.HandlePayload(R"({"id":11,"method":"ping"})");
    REQUIRE(encoded.has_value());
    CHECK(*encoded == R"({"jsonrpc":"2.0","id":11,"result":{}})");

    CHECK_FALSE(server.HandlePayload("[]").has_value());
    CHECK_FALSE(server.HandlePayload(R"({"method":"ping"})").has_value());
}

TEST_CASE("McpServer: empty input ends cleanly", "[mcp][server]") {
    Harness h("");
    CHECK(h.Run().IsOk());
    CHECK(h.out.str().empty());
}
