#include <catch2/catch_test_macros.hpp>

#include <sap_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace sap_mcp;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

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

// ===========================================================================
// Level names
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: rejects unknown names", "[log]") {
    CHECK_FALSE(ParseLogLevel("").has_value());
    CHECK_FALSE(ParseLogLevel("trace").has_value());
    CHECK_FALSE(ParseLogLevel("errors").has_value());
}

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: writes timestamped line to its stream", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);

    sink.Write(LogLevel::Warn, "mcp", "Unknown method: foo");

    auto output = oss.str();
    CHECK(output.find("[WARN]") != std::string::npos);
    CHECK(output.find("[mcp]") != std::string::npos);
    CHECK(output.find("Unknown method: foo") != std::string::npos);
    REQUIRE(!output.empty());
    CHECK(output.back() == '\n');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "mcp", "started");

    auto line = oss.str();
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');

    auto j = nlohmann::json::parse(line);
    CHECK(j["level"] == "INFO");
    CHECK(j["component"] == "mcp");
    CHECK(j["message"] == "started");
    CHECK(j["ts"].is_string());
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second\nwith newline");

    auto output = oss.str();
    auto count = std::count(output.begin(), output.end(), '\n');
    CHECK(count == 2);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto j = nlohmann::json::parse(oss.str());
    CHECK(j["message"] == "line1\nline2\ttab \"quoted\" back\\slash");
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());
    CHECK_FALSE(logger.Enabled(LogLevel::Info));

    logger.SetLevel(LogLevel::Info);
    CHECK(logger.Enabled(LogLevel::Info));
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Info("transport", "Response written");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "transport");
    CHECK(sink_ptr->messages[0].message == "Response written");
    CHECK(sink_ptr->messages[0].level == LogLevel::Info);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "mcp", "Executing tool: sap_connect");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[mcp]") != std::string::npos);
    CHECK(output.find("Executing tool: sap_connect") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: each level produces distinct ANSI codes", "[log]") {
    std::ostringstream debug_oss, info_oss, warn_oss, error_oss;
    ColorConsoleSink debug_sink(true, debug_oss);
    ColorConsoleSink info_sink(true, info_oss);
    ColorConsoleSink warn_sink(true, warn_oss);
    ColorConsoleSink error_sink(true, error_oss);

    debug_sink.Write(LogLevel::Debug, "x", "msg");
    info_sink.Write(LogLevel::Info, "x", "msg");
    warn_sink.Write(LogLevel::Warn, "x", "msg");
    error_sink.Write(LogLevel::Error, "x", "msg");

    CHECK(debug_oss.str().find("\033[90m") != std::string::npos);
    CHECK(info_oss.str().find("\033[36m") != std::string::npos);
    CHECK(warn_oss.str().find("\033[33m") != std::string::npos);
    CHECK(error_oss.str().find("\033[1;31m") != std::string::npos);
}

TEST_CASE("ColorConsoleSink: ERROR messages get red text", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "mcp", "Error handling tools/call");

    // Bold red appears for the level tag and again for the message.
    auto output = oss.str();
    auto first = output.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(output.find("\033[1;31m", first + 1) != std::string::npos);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: InitGlobalLogger routes free functions", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("g", "filtered");
    LogInfo("g", "info");
    LogError("g", "error");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].message == "info");
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);

    // Leave a quiet logger behind for the other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
