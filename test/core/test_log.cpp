#include <catch2/catch_test_macros.hpp>

#include <toolhost/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace toolhost;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

} // anonymous namespace

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts the four names in any case", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: rejects unknown names", "[log]") {
    CHECK_FALSE(ParseLogLevel("").has_value());
    CHECK_FALSE(ParseLogLevel("trace").has_value());
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "mcp", "initialize");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"mcp\"") != std::string::npos);
    CHECK(line.find("\"message\":\"initialize\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
    CHECK(std::count(output.begin(), output.end(), '\n') == 1);
}

TEST_CASE("JsonSink: lines parse as JSON even with invalid UTF-8", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Warn, "fs", "skipping bad\xFFname");

    auto line = oss.str();
    REQUIRE(!line.empty());
    line.pop_back();
    auto parsed = nlohmann::json::parse(line);
    CHECK(parsed["level"] == "WARN");
    CHECK(parsed["component"] == "fs");
    CHECK(parsed["message"] == "skipping bad\xEF\xBF\xBDname");
}

TEST_CASE("JsonSink: owning constructor writes to the owned stream", "[log]") {
    auto owned = std::make_unique<std::ostringstream>();
    auto* raw = owned.get();
    JsonSink sink(std::move(owned));

    sink.Write(LogLevel::Error, "tools", "boom");
    CHECK(raw->str().find("\"message\":\"boom\"") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Log(LogLevel::Debug, "c", "should be filtered");
    logger.Log(LogLevel::Info, "c", "should be filtered");
    logger.Log(LogLevel::Warn, "c", "should pass");
    logger.Log(LogLevel::Error, "c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Log(LogLevel::Info, "c", "filtered");
    CHECK(sink_ptr->messages.empty());
    CHECK_FALSE(logger.IsEnabled(LogLevel::Info));

    logger.SetLevel(LogLevel::Info);
    CHECK(logger.IsEnabled(LogLevel::Info));
    logger.Log(LogLevel::Info, "c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Log(LogLevel::Info, "http", "GET http://example.test/");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "http");
    CHECK(sink_ptr->messages[0].message == "GET http://example.test/");
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Log(LogLevel::Info, "thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "http", "GET http://example.test/");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[http]") != std::string::npos);
    CHECK(output.find("GET http://example.test/") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode contains ANSI escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Warn, "tools", "fetch failed");

    auto output = oss.str();
    CHECK(output.find("\033[") != std::string::npos);
    CHECK(output.find("fetch failed") != std::string::npos);
    CHECK(output.find("WARN") != std::string::npos);
    CHECK(output.back() == '\n');
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: LogInfo goes to the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("config", "hidden");
    LogInfo("config", "shown");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "config");

    // Leave a quiet logger behind for the other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
