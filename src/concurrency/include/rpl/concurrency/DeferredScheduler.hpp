// /////////////////////////////////////////////////////////////////////////////
/// @file DeferredScheduler.hpp
/// @brief Single-threaded deferred task queue keyed to ticks or seconds.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/core/Types.hpp>
#include <rpl/core/NonCopyable.hpp>

#include <functional>
#include <string>
#include <vector>

namespace rpl::concurrency {

/// @brief Handle identifying a scheduled task (0 is never issued).
using TaskId = core::u64;

inline constexpr TaskId kInvalidTask = 0;

// /////////////////////////////////////////////////////////////////////////////
/// @class DeferredScheduler
/// @brief Runs callbacks at a later tick or after an elapsed time.
///
/// Owned by one participant and driven from its tick; never touched by
/// another thread.  A task is due either at a tick count or at a point on
/// the participant clock, never both.  Due tick-keyed tasks run before due
/// time-keyed ones, each group in (due, submission) order.  A task scheduled while advance() runs is never executed by that
/// same advance() call, even if already due.
///
/// @par Usage
/// @code
///   DeferredScheduler sched;
///   sched.scheduleAfterTicks(1, [] { /* second pass */ }, "pass2");
///   sched.scheduleAfterSeconds(0.5, [] { /* sweep */ }, "sweep");
///   sched.advance(tick, seconds);
/// @endcode
// /////////////////////////////////////////////////////////////////////////////
class DeferredScheduler final : public core::NonCopyable<DeferredScheduler>
{
public:
    using Task = std::function<void()>;

    DeferredScheduler() noexcept;
    ~DeferredScheduler();

    // --------------------------------------------------------------------- //
    //  Submission                                                            //
    // --------------------------------------------------------------------- //

    /// @brief Schedules @p task at an absolute tick.
    TaskId scheduleAtTick(core::u64 tick, Task task, std::string label = {});

    /// @brief Schedules @p task @p ticks ticks after the current tick.
    TaskId scheduleAfterTicks(core::u64 ticks, Task task, std::string label = {});

    /// @brief Schedules @p task @p seconds after the current clock time.
    TaskId scheduleAfterSeconds(core::f64 seconds, Task task, std::string label = {});

    /// @brief Cancels a pending task.
    /// @return true if the task was pending and is now cancelled.
    bool cancel(TaskId id) noexcept;

    // --------------------------------------------------------------------- //
    //  Driving                                                               //
    // --------------------------------------------------------------------- //

    /// @brief Moves the scheduler to (@p tick, @p now) and runs due tasks.
    /// @return Number of tasks executed.
    core::u32 advance(core::u64 tick, core::f64 now);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::usize pendingCount() const noexcept;
    [[nodiscard]] bool        isPending(TaskId id) const noexcept;
    [[nodiscard]] core::u64   currentTick() const noexcept { return _tick; }
    [[nodiscard]] core::f64   currentTime() const noexcept { return _now; }

private:
    enum class Clock : core::u8 { Tick, Seconds };

    struct Entry
    {
        TaskId      id;
        Clock       clock;
        core::u64   dueTick;
        core::f64   dueTime;
        core::u64   sequence;
        Task        task;
        std::string label;
    };

    TaskId push(Clock clock, core::u64 dueTick, core::f64 dueTime, Task task, std::string label);
    [[nodiscard]] bool isDue(const Entry &e) const noexcept;

    std::vector<Entry> _entries;
    core::u64          _tick{0};
    core::f64          _now{0.0};
    TaskId             _nextId{1};
    core::u64          _nextSequence{0};
};

} // namespace rpl::concurrency
