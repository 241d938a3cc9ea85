#include <kaizen_mcp/mcp/framing.hpp>

#include <kaizen_mcp/core/log.hpp>
#include <kaizen_mcp/core/strings.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

namespace kaizen_mcp {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

Error MakeFramingError(const std::string& message) {
    return Error{"ReadFrame", "stdin", std::nullopt, message,
                 ErrorCategory::Framing};
}

bool StartsWithBrace(std::string_view s) {
    return !s.empty() && s.front() == '{';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseContentLength
// ---------------------------------------------------------------------------
Result<std::size_t, Error> ParseContentLength(
    const std::vector<std::string>& headers) {
    using R = Result<std::size_t, Error>;

    for (const auto& header : headers) {
        const auto colon = header.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto name = strings::Trim(std::string_view(header).substr(0, colon));
        if (!strings::IEquals(name, "Content-Length")) {
            continue;
        }

        const auto raw = strings::Trim(std::string_view(header).substr(colon + 1));
        long long length = 0;
        const auto* first = raw.data();
        const auto* last = raw.data() + raw.size();
        if (first != last && *first == '+') {
            ++first;
        }
        auto [ptr, ec] = std::from_chars(first, last, length);
        if (raw.empty() || ec != std::errc{} || ptr != last || length <= 0 ||
            static_cast<unsigned long long>(length) >
                std::numeric_limits<std::size_t>::max()) {
            return R::Err(MakeFramingError(
                "invalid Content-Length value: \"" + std::string(raw) + "\""));
        }
        return R::Ok(static_cast<std::size_t>(length));
    }
    return R::Err(MakeFramingError("missing Content-Length header"));
}

// ---------------------------------------------------------------------------
// FrameReader
// ---------------------------------------------------------------------------
FrameReader::FrameReader(std::istream& in) : in_(in) {}

Result<std::optional<FrameReader::Line>, Error> FrameReader::ReadLine() {
    using R = Result<std::optional<Line>, Error>;

    Line line;
    if (!std::getline(in_, line.text)) {
        if (in_.bad()) {
            return R::Err(MakeFramingError("failed to read from input stream"));
        }
        return R::Ok(std::nullopt);
    }
    // getline sets eofbit only when it ran out of input before '\n'.
    line.terminated = !in_.eof();
    return R::Ok(std::move(line));
}

Result<std::string, Error> FrameReader::ReadPayload(std::size_t length) {
    using R = Result<std::string, Error>;

    std::string payload;
    payload.reserve(std::min(length, kReadChunk));
    std::string chunk;
    while (payload.size() < length) {
        const auto want = std::min(kReadChunk, length - payload.size());
        chunk.resize(want);
        in_.read(chunk.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in_.gcount());
        payload.append(chunk.data(), got);
        if (got < want) {
            return R::Err(MakeFramingError(
                "failed to read payload: expected " + std::to_string(length) +
                " bytes, got " + std::to_string(payload.size())));
        }
    }
    return R::Ok(std::move(payload));
}

Result<std::optional<std::string>, Error> FrameReader::Next() {
    using R = Result<std::optional<std::string>, Error>;

    auto first = ReadLine();
    if (first.IsErr()) {
        return R::Err(std::move(first).Error());
    }
    if (!first.Value().has_value()) {
        return R::Ok(std::nullopt);
    }

    const auto& line = *first.Value();
    const auto trimmed = strings::Trim(line.text);

    if (!line.terminated) {
        if (trimmed.empty()) {
            return R::Ok(std::nullopt);
        }
        // A final JSON line without '\n' is still a complete message.
        if (StartsWithBrace(trimmed)) {
            return R::Ok(std::string(trimmed));
        }
        return R::Err(MakeFramingError(
            "unexpected end of stream in header block"));
    }

    if (trimmed.empty()) {
        return R::Err(MakeFramingError("received empty message"));
    }
    if (StartsWithBrace(trimmed)) {
        return R::Ok(std::string(trimmed));
    }

    std::vector<std::string> headers{
        std::string(strings::StripLineEnding(line.text))};
    while (true) {
        auto next = ReadLine();
        if (next.IsErr()) {
            return R::Err(std::move(next).Error());
        }
        if (!next.Value().has_value() || !next.Value()->terminated) {
            return R::Err(MakeFramingError(
                "unexpected end of stream in header block"));
        }
        auto clean = strings::StripLineEnding(next.Value()->text);
        if (clean.empty()) {
            break;
        }
        headers.emplace_back(clean);
    }

    auto length = ParseContentLength(headers);
    if (length.IsErr()) {
        return R::Err(std::move(length).Error());
    }

    LogDebug("framing", "reading framed payload",
             {{"bytes", std::to_string(length.Value())}});

    auto payload = ReadPayload(length.Value());
    if (payload.IsErr()) {
        return R::Err(std::move(payload).Error());
    }
    return R::Ok(std::move(payload).Value());
}

// ---------------------------------------------------------------------------
// FrameWriter
// ---------------------------------------------------------------------------
FrameWriter::FrameWriter(std::ostream& out) : out_(out) {}

Result<void, Error> FrameWriter::Write(std::string_view payload) {
    out_ << "Content-Length: " << payload.size() << "\r\n\r\n";
    out_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(
            Error{"WriteFrame", "stdout", std::nullopt,
                  "failed to write response", ErrorCategory::Framing});
    }
    return Result<void, Error>::Ok();
}

} // namespace kaizen_mcp
