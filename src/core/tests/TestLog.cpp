/**
 * @file TestLog.cpp
 * @brief Unit tests for the Log façade and level filtering.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/core/Log.hpp>

#include <string>
#include <vector>

using namespace rpl::core;

namespace {

struct CaptureLogger final : ILogger {
    std::vector<std::string> lines;

    void write(LogLevel, std::string_view tag, std::string_view message) override
    {
        lines.emplace_back(std::string{tag} + "|" + std::string{message});
    }
};

} // namespace

TEST_CASE("Log routes messages to the installed logger", "[core][log]")
{
    CaptureLogger capture;
    const LogLevel previous = Log::minLevel();
    Log::setLogger(&capture);
    Log::setMinLevel(LogLevel::kInfo);

    Log::debug("REPL", "hidden");
    Log::info("REPL", "shown");
    Log::warn("plain");

    Log::setLogger(nullptr);
    Log::setMinLevel(previous);

    REQUIRE(capture.lines.size() == 2);
    REQUIRE(capture.lines[0] == "REPL|shown");
    REQUIRE(capture.lines[1] == "rpl|plain");
}
