// /////////////////////////////////////////////////////////////////////////////
/// @file TickLoop.cpp
/// @brief TickLoop implementation: fixed time-step with accumulator.
// /////////////////////////////////////////////////////////////////////////////

#include <rpl/engine/TickLoop.hpp>

#include <rpl/core/Assert.hpp>
#include <rpl/core/Log.hpp>

#include <chrono>
#include <string>
#include <thread>

namespace rpl::engine {

TickLoop::TickLoop(const Config &config)
    : _fixedDt{config.fixedDeltaTime()}
{
    RPL_ASSERT(config.tickRate() > 0);
}

TickLoop::~TickLoop() = default;

void TickLoop::run(const LoopCallbacks &callbacks)
{
    RPL_ASSERT(callbacks.fixedUpdate);
    _running       = true;
    _stopRequested = false;
    _tickCount     = 0;

    using Clock = std::chrono::steady_clock;
    auto previous = Clock::now();
    core::f64 accumulator = 0.0;

    while (!_stopRequested)
    {
        const auto current = Clock::now();
        core::f64 frameTime = std::chrono::duration<core::f64>(current - previous).count();
        previous = current;

        constexpr core::f64 kMaxFrameTime = 0.25;
        if (frameTime > kMaxFrameTime)
        {
            frameTime = kMaxFrameTime;
        }

        if (callbacks.preFrame)
        {
            callbacks.preFrame();
        }

        accumulator += frameTime;

        while (accumulator >= _fixedDt && !_stopRequested)
        {
            callbacks.fixedUpdate(_fixedDt);
            accumulator -= _fixedDt;
            ++_tickCount;
        }

        if (callbacks.postFrame)
        {
            callbacks.postFrame();
        }

        if (accumulator < _fixedDt)
        {
            std::this_thread::sleep_for(std::chrono::duration<core::f64>(_fixedDt - accumulator));
        }
    }

    _running = false;
    core::Log::info("REPL", "TickLoop: stopped after " + std::to_string(_tickCount) + " ticks");
}

core::u64 TickLoop::runTicks(core::u64 count, const LoopCallbacks &callbacks)
{
    RPL_ASSERT(callbacks.fixedUpdate);
    _running       = true;
    _stopRequested = false;

    core::u64 ran = 0;
    while (ran < count && !_stopRequested)
    {
        if (callbacks.preFrame)
        {
            callbacks.preFrame();
        }

        callbacks.fixedUpdate(_fixedDt);
        ++_tickCount;
        ++ran;

        if (callbacks.postFrame)
        {
            callbacks.postFrame();
        }
    }

    _running = false;
    return ran;
}

void TickLoop::requestStop() noexcept
{
    _stopRequested = true;
}

bool TickLoop::isRunning() const noexcept
{
    return _running;
}

core::u64 TickLoop::tickCount() const noexcept
{
    return _tickCount;
}

core::f64 TickLoop::fixedDeltaTime() const noexcept
{
    return _fixedDt;
}

} // namespace rpl::engine
