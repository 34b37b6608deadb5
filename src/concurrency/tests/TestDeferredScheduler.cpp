/**
 * @file TestDeferredScheduler.cpp
 * @brief Unit tests for DeferredScheduler ordering, cancellation and
 *        deferral of tasks scheduled from inside a task.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/concurrency/DeferredScheduler.hpp>

#include <vector>

using namespace rpl::concurrency;

TEST_CASE("Tick tasks run once their tick is reached", "[concurrency][scheduler]")
{
    DeferredScheduler sched;
    int runs = 0;
    sched.scheduleAfterTicks(2, [&] { ++runs; }, "two");

    REQUIRE(sched.advance(1, 0.0) == 0);
    REQUIRE(runs == 0);
    REQUIRE(sched.advance(2, 0.0) == 1);
    REQUIRE(runs == 1);
    REQUIRE(sched.pendingCount() == 0);
    REQUIRE(sched.advance(3, 0.0) == 0);
}

TEST_CASE("Time tasks run in due order", "[concurrency][scheduler]")
{
    DeferredScheduler sched;
    std::vector<int> order;
    sched.scheduleAfterSeconds(3.0, [&] { order.push_back(3); });
    sched.scheduleAfterSeconds(0.5, [&] { order.push_back(1); });
    sched.scheduleAfterSeconds(1.5, [&] { order.push_back(2); });

    REQUIRE(sched.advance(10, 0.4) == 0);
    REQUIRE(sched.advance(100, 10.0) == 3);
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Same-due tasks keep submission order", "[concurrency][scheduler]")
{
    DeferredScheduler sched;
    std::vector<int> order;
    for (int i = 0; i < 4; ++i)
        sched.scheduleAtTick(5, [&order, i] { order.push_back(i); });

    sched.advance(5, 0.0);
    REQUIRE(order == std::vector<int>{0, 1, 2, 3});
}

TEST_CASE("Cancelled tasks never run", "[concurrency][scheduler]")
{
    DeferredScheduler sched;
    int runs = 0;
    const TaskId a = sched.scheduleAfterTicks(1, [&] { ++runs; });
    TaskId b = kInvalidTask;
    sched.scheduleAtTick(1, [&] { sched.cancel(b); });
    b = sched.scheduleAtTick(1, [&] { runs += 10; });

    REQUIRE(sched.isPending(a));
    REQUIRE(sched.cancel(a));
    REQUIRE_FALSE(sched.cancel(a));

    REQUIRE(sched.advance(1, 0.0) == 1);
    REQUIRE(runs == 0);
}

TEST_CASE("A task scheduled from a task waits for the next advance", "[concurrency][scheduler]")
{
    DeferredScheduler sched;
    int inner = 0;
    sched.scheduleAfterTicks(0, [&] {
        sched.scheduleAfterTicks(0, [&] { ++inner; });
    });

    REQUIRE(sched.advance(0, 0.0) == 1);
    REQUIRE(inner == 0);
    REQUIRE(sched.pendingCount() == 1);
    REQUIRE(sched.advance(0, 0.0) == 1);
    REQUIRE(inner == 1);
}
