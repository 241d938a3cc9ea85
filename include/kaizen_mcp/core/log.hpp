#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kaizen_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

enum class LogFormat {
    Json,
    Text,
};

// Structured key/value pairs attached to a log record, in insertion order.
using LogFields = std::vector<std::pair<std::string, std::string>>;

/// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// Parse "json" or "text" (case-insensitive).
std::optional<LogFormat> ParseLogFormat(std::string_view name);

// Abstract log sink: implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message, const LogFields& fields) = 0;
};

// Console sink: human-readable lines, fields appended as key=value.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogFields& fields) override;
private:
    std::ostream& out_;
};

// JSON sink: one JSON object per line; fields become extra members.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogFields& fields) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message,
               const LogFields& fields = {});
    void Info(std::string_view component, std::string_view message,
              const LogFields& fields = {});
    void Warn(std::string_view component, std::string_view message,
              const LogFields& fields = {});
    void Error(std::string_view component, std::string_view message,
               const LogFields& fields = {});

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message, const LogFields& fields);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Install the process-wide logger. Until called, logging is a no-op.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message,
              const LogFields& fields = {});
void LogInfo(std::string_view component, std::string_view message,
             const LogFields& fields = {});
void LogWarn(std::string_view component, std::string_view message,
             const LogFields& fields = {});
void LogError(std::string_view component, std::string_view message,
              const LogFields& fields = {});

} // namespace kaizen_mcp
