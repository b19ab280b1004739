/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging facade
 */

#include <doctest/doctest.h>
#include "../../libqreport/include/logger.hpp"
#include <string>
#include <vector>

namespace {

struct Line {
    LogLevel level;
    std::string message;
    std::string tag;
};

class CaptureSink final : public ILogSink {
public:
    explicit CaptureSink(std::vector<Line>& lines) : lines_(lines) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        lines_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Line>& lines_;
};

} // namespace

TEST_CASE("Logger dispatches to registered sinks") {
    std::vector<Line> lines;
    const ILogSink* sink = Logger::add_sink(std::make_unique<CaptureSink>(lines));
    REQUIRE(sink != nullptr);

    Logger::log(LogLevel::Warning, "disk almost full", "storage_budgeter");
    Logger::log(LogLevel::Info, "default tag");
    Logger::remove_sink(sink);
    Logger::log(LogLevel::Error, "not captured", "test");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].level == LogLevel::Warning);
    CHECK(lines[0].message == "disk almost full");
    CHECK(lines[0].tag == "storage_budgeter");
    CHECK(lines[1].tag == "qreport");

    CHECK(Logger::add_sink(nullptr) == nullptr);
}

TEST_CASE("Logger level names") {
    CHECK(std::string(Logger::level_to_string(LogLevel::Warning)) == "WARN");
    CHECK(Logger::string_to_level("DEBUG") == LogLevel::Debug);
    CHECK(Logger::string_to_level("INFO") == LogLevel::Info);
    CHECK(Logger::string_to_level("WARNING") == LogLevel::Warning);
    CHECK(Logger::string_to_level("ERROR") == LogLevel::Error);
    CHECK(Logger::string_to_level("unknown") == LogLevel::Error);
}
