// /////////////////////////////////////////////////////////////////////////////
/// @file TickLoop.hpp
/// @brief Fixed time-step driver with accumulator.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rpl/engine/Config.hpp>

#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <functional>

namespace rpl::engine {

/// @brief Hooks invoked by the loop.  Only fixedUpdate is required.
struct LoopCallbacks
{
    std::function<void()>          preFrame;
    std::function<void(core::f64)> fixedUpdate;
    std::function<void()>          postFrame;
};

/// @brief Runs fixedUpdate at the configured tick rate.
///
/// run() follows the wall clock and blocks until requestStop() is called,
/// typically from inside a callback.  runTicks() steps a fixed number of
/// ticks back to back, for tests and offline runs.
class TickLoop final : public core::NonCopyable<TickLoop>
{
public:
    explicit TickLoop(const Config &config);
    ~TickLoop();

    void run(const LoopCallbacks &callbacks);

    /// @return Number of ticks actually run (less when stopped early).
    core::u64 runTicks(core::u64 count, const LoopCallbacks &callbacks);

    void requestStop() noexcept;

    [[nodiscard]] bool      isRunning() const noexcept;
    [[nodiscard]] core::u64 tickCount() const noexcept;
    [[nodiscard]] core::f64 fixedDeltaTime() const noexcept;

private:
    core::f64 _fixedDt;
    bool      _running{false};
    bool      _stopRequested{false};
    core::u64 _tickCount{0};
};

} // namespace rpl::engine
