/**
 * @file TestTickLoop.cpp
 * @brief Unit tests for the fixed time-step loop.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/engine/TickLoop.hpp>

#include <rpl/core/Log.hpp>

#include <string>
#include <vector>

using namespace rpl::engine;

namespace {

struct TagCapture final : rpl::core::ILogger {
    std::vector<std::string> tags;

    void write(rpl::core::LogLevel, std::string_view tag, std::string_view) override
    {
        tags.emplace_back(tag);
    }
};

} // namespace

TEST_CASE("runTicks steps exactly the requested count", "[engine][loop]")
{
    TickLoop loop{Config::Builder{}.tickRate(50).build()};
    int frames = 0;
    double total = 0.0;

    LoopCallbacks cb;
    cb.preFrame    = [&] { ++frames; };
    cb.fixedUpdate = [&](double dt) { total += dt; };

    REQUIRE(loop.runTicks(100, cb) == 100);
    REQUIRE(loop.tickCount() == 100);
    REQUIRE(frames == 100);
    REQUIRE(total > 1.999);
    REQUIRE(total < 2.001);
    REQUIRE_FALSE(loop.isRunning());
}

TEST_CASE("requestStop ends runTicks early", "[engine][loop]")
{
    TickLoop loop{Config::Builder{}.build()};
    LoopCallbacks cb;
    cb.fixedUpdate = [&](double) {
        if (loop.tickCount() == 9)
            loop.requestStop();
    };

    REQUIRE(loop.runTicks(1000, cb) == 10);
}

TEST_CASE("run follows the clock until stopped", "[engine][loop]")
{
    TickLoop loop{Config::Builder{}.tickRate(200).build()};
    bool sawRunning = false;

    LoopCallbacks cb;
    cb.fixedUpdate = [&](double dt) {
        sawRunning = loop.isRunning();
        REQUIRE(dt == loop.fixedDeltaTime());
    };
    cb.postFrame = [&] {
        if (loop.tickCount() >= 3)
            loop.requestStop();
    };

    TagCapture capture;
    rpl::core::Log::setLogger(&capture);
    loop.run(cb);
    rpl::core::Log::setLogger(nullptr);

    REQUIRE(sawRunning);
    REQUIRE_FALSE(capture.tags.empty());
    REQUIRE(capture.tags.back() == "REPL");
    REQUIRE(loop.tickCount() >= 3);
    REQUIRE_FALSE(loop.isRunning());
}
