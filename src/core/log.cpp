#include <kaizen_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kaizen_mcp {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

// Escape a string for JSON output (handles \, ", and control characters).
void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u"
                        << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

// Quote console field values that would otherwise be ambiguous.
void WriteConsoleValue(std::ostream& out, std::string_view value) {
    const bool needs_quotes = value.empty() ||
        std::any_of(value.begin(), value.end(), [](char c) {
            return c == ' ' || c == '"' || c == '=' ||
                   static_cast<unsigned char>(c) < 0x20;
        });
    if (!needs_quotes) {
        out << value;
        return;
    }
    out << '"';
    JsonEscape(out, value);
    out << '"';
}

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    const auto lower = Lower(name);
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

std::optional<LogFormat> ParseLogFormat(std::string_view name) {
    const auto lower = Lower(name);
    if (lower == "json") return LogFormat::Json;
    if (lower == "text") return LogFormat::Text;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message, const LogFields& fields) {
    out_ << Iso8601Now()
         << " [" << LevelName(level) << "] "
         << "[" << component << "] "
         << message;
    for (const auto& [key, value] : fields) {
        out_ << ' ' << key << '=';
        WriteConsoleValue(out_, value);
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message, const LogFields& fields) {
    out_ << "{\"ts\":\"" << Iso8601Now()
         << "\",\"level\":\"" << LevelName(level)
         << "\",\"component\":\"";
    JsonEscape(out_, component);
    out_ << "\",\"message\":\"";
    JsonEscape(out_, message);
    out_ << '"';
    for (const auto& [key, value] : fields) {
        out_ << ",\"";
        JsonEscape(out_, key);
        out_ << "\":\"";
        JsonEscape(out_, value);
        out_ << '"';
    }
    out_ << "}\n";
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Debug(std::string_view component, std::string_view message,
                   const LogFields& fields) {
    Log(LogLevel::Debug, component, message, fields);
}

void Logger::Info(std::string_view component, std::string_view message,
                  const LogFields& fields) {
    Log(LogLevel::Info, component, message, fields);
}

void Logger::Warn(std::string_view component, std::string_view message,
                  const LogFields& fields) {
    Log(LogLevel::Warn, component, message, fields);
}

void Logger::Error(std::string_view component, std::string_view message,
                   const LogFields& fields) {
    Log(LogLevel::Error, component, message, fields);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message, const LogFields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message, fields);
    }
}

// ---------------------------------------------------------------------------
// NullSink: discards all messages (used before InitGlobalLogger is called).
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view,
               const LogFields&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message,
              const LogFields& fields) {
    GlobalLogger().Debug(component, message, fields);
}

void LogInfo(std::string_view component, std::string_view message,
             const LogFields& fields) {
    GlobalLogger().Info(component, message, fields);
}

void LogWarn(std::string_view component, std::string_view message,
             const LogFields& fields) {
    GlobalLogger().Warn(component, message, fields);
}

void LogError(std::string_view component, std::string_view message,
              const LogFields& fields) {
    GlobalLogger().Error(component, message, fields);
}

} // namespace kaizen_mcp
