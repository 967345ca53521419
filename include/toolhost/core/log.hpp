#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace toolhost {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// "debug" | "info" | "warn" | "error" (case-insensitive); nullopt otherwise.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// Upper-case level name, e.g. "WARN".
const char* LogLevelName(LogLevel level);

// Where log lines go. Calls are serialized by Logger, so sinks need no
// locking of their own.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines for a terminal. stdout carries JSON-RPC frames, so
// the default stream is stderr. Without color the line is
// "<ISO-8601> [LEVEL] [component] message".
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"component", "level", "message", "ts"}.
// Messages often carry host paths and URLs; bytes that are not UTF-8 are
// written as U+FFFD so every line stays parseable.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    explicit JsonSink(std::unique_ptr<std::ostream> owned);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
};

// Level filter in front of a sink. The level check is lock-free, so
// disabled debug lines on worker threads cost one atomic load.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex sink_mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Installed once in main() before any worker starts;
// until then everything is discarded.
// ---------------------------------------------------------------------------

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace toolhost
