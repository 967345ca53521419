#include <toolhost/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace toolhost {

namespace {

namespace color {
constexpr const char* kReset  = "\033[0m";
constexpr const char* kGray   = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";
} // namespace color

struct Timestamp {
    std::tm utc{};
    std::tm local{};
    int millis = 0;
};

Timestamp Now() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    Timestamp ts;
    gmtime_r(&secs, &ts.utc);
    localtime_r(&secs, &ts.local);
    ts.millis = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000);
    return ts;
}

// 2026-01-31T12:34:56.789Z
std::string FormatIso8601(const Timestamp& ts) {
    std::ostringstream oss;
    oss << std::put_time(&ts.utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ts.millis << 'Z';
    return oss.str();
}

// Colored lines carry wall-clock time only.
std::string FormatClock(const Timestamp& ts) {
    std::ostringstream oss;
    oss << std::put_time(&ts.local, "%H:%M:%S");
    return oss.str();
}

struct LevelStyle {
    const char* color;
    const char* tag;   // padded to 5 columns
};

LevelStyle StyleFor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {color::kGray, "DEBUG"};
        case LogLevel::Info:  return {color::kCyan, "INFO "};
        case LogLevel::Warn:  return {color::kYellow, "WARN "};
        case LogLevel::Error: return {color::kRed, "ERROR"};
    }
    return {"", "     "};
}

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto logger = std::make_unique<Logger>(
        std::make_unique<DiscardSink>(), LogLevel::Error);
    return logger;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    const auto ts = Now();
    if (use_color_) {
        const auto style = StyleFor(level);
        out_ << color::kGray << FormatClock(ts) << color::kReset << ' '
             << style.color << style.tag << color::kReset << ' '
             << color::kGray << '[' << component << ']' << color::kReset << ' ';
        if (level == LogLevel::Error) {
            out_ << style.color << message << color::kReset;
        } else {
            out_ << message;
        }
    } else {
        out_ << FormatIso8601(ts) << " [" << LogLevelName(level) << "] ["
             << component << "] " << message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

JsonSink::JsonSink(std::unique_ptr<std::ostream> owned)
    : owned_(std::move(owned)), out_(*owned_) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json line = {
        {"ts", FormatIso8601(Now())},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) noexcept {
    min_level_.store(level);
}

bool Logger::IsEnabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    if (!IsEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace toolhost
