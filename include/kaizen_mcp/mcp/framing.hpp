#pragma once

#include <kaizen_mcp/core/result.hpp>

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// FrameReader: extracts one message payload per call from a byte stream.
//
// Two framings are accepted and may be mixed within one stream:
//   - "Content-Length: <n>\r\n\r\n<n bytes>" (other headers ignored)
//   - one JSON object per line, detected by a first line starting with '{'
//
// Next() returns:
//   - Ok(payload)       one complete frame
//   - Ok(std::nullopt)  clean end of stream
//   - Err(Error)        framing or I/O failure; the stream is not resumable
// ---------------------------------------------------------------------------
class FrameReader {
public:
    explicit FrameReader(std::istream& in);

    [[nodiscard]] Result<std::optional<std::string>, Error> Next();

private:
    struct Line {
        std::string text;
        bool terminated = false;  // false when end of stream cut it short
    };

    // Returns nullopt when the stream is exhausted with nothing read.
    Result<std::optional<Line>, Error> ReadLine();
    Result<std::string, Error> ReadPayload(std::size_t length);

    std::istream& in_;
};

/// Locate Content-Length (case-insensitive) among raw header lines and return
/// its positive value. Lines without ':' and unrelated headers are skipped.
[[nodiscard]] Result<std::size_t, Error> ParseContentLength(
    const std::vector<std::string>& headers);

// ---------------------------------------------------------------------------
// FrameWriter: writes Content-Length framed payloads and flushes each one.
// ---------------------------------------------------------------------------
class FrameWriter {
public:
    explicit FrameWriter(std::ostream& out);

    [[nodiscard]] Result<void, Error> Write(std::string_view payload);

private:
    std::ostream& out_;
};

} // namespace kaizen_mcp
