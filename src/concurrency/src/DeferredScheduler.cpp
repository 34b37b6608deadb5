/**
 * @file DeferredScheduler.cpp
 * @brief DeferredScheduler implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/concurrency/DeferredScheduler.hpp>
#include <rpl/core/Assert.hpp>
#include <rpl/core/Log.hpp>

#include <algorithm>
#include <string>

namespace rpl::concurrency {

DeferredScheduler::DeferredScheduler() noexcept = default;

DeferredScheduler::~DeferredScheduler()
{
    if (!_entries.empty())
    {
        core::Log::debug("SCHED", "DeferredScheduler: dropping " +
                         std::to_string(_entries.size()) + " pending task(s)");
    }
}

// -------------------------------------------------------------------------- //
//  Submission                                                                //
// -------------------------------------------------------------------------- //

TaskId DeferredScheduler::push(Clock clock, core::u64 dueTick, core::f64 dueTime,
                               Task task, std::string label)
{
    RPL_ASSERT(task);
    const TaskId id = _nextId++;
    _entries.push_back(Entry{id, clock, dueTick, dueTime, _nextSequence++,
                             std::move(task), std::move(label)});
    return id;
}

TaskId DeferredScheduler::scheduleAtTick(core::u64 tick, Task task, std::string label)
{
    return push(Clock::Tick, tick, 0.0, std::move(task), std::move(label));
}

TaskId DeferredScheduler::scheduleAfterTicks(core::u64 ticks, Task task, std::string label)
{
    return push(Clock::Tick, _tick + ticks, 0.0, std::move(task), std::move(label));
}

TaskId DeferredScheduler::scheduleAfterSeconds(core::f64 seconds, Task task, std::string label)
{
    return push(Clock::Seconds, 0, _now + std::max(seconds, 0.0), std::move(task), std::move(label));
}

bool DeferredScheduler::cancel(TaskId id) noexcept
{
    auto it = std::find_if(_entries.begin(), _entries.end(),
                           [id](const Entry &e) { return e.id == id; });
    if (it == _entries.end())
        return false;
    _entries.erase(it);
    return true;
}

// -------------------------------------------------------------------------- //
//  Driving                                                                   //
// -------------------------------------------------------------------------- //

bool DeferredScheduler::isDue(const Entry &e) const noexcept
{
    return e.clock == Clock::Tick ? e.dueTick <= _tick : e.dueTime <= _now;
}

core::u32 DeferredScheduler::advance(core::u64 tick, core::f64 now)
{
    _tick = std::max(_tick, tick);
    _now  = std::max(_now, now);

    // Snapshot of what is due now; tasks pushed while running wait.
    struct Due
    {
        Clock     clock;
        core::f64 key;
        core::u64 sequence;
        TaskId    id;
    };
    std::vector<Due> due;
    for (const auto &e : _entries)
    {
        if (!isDue(e))
            continue;
        const core::f64 key = e.clock == Clock::Tick ? static_cast<core::f64>(e.dueTick) : e.dueTime;
        due.push_back(Due{e.clock, key, e.sequence, e.id});
    }

    // Tick-keyed tasks first, then time-keyed; each by (due, submission).
    std::sort(due.begin(), due.end(), [](const Due &a, const Due &b) {
        if (a.clock != b.clock)
            return a.clock == Clock::Tick;
        if (a.key != b.key)
            return a.key < b.key;
        return a.sequence < b.sequence;
    });

    core::u32 executed = 0;
    for (const auto &d : due)
    {
        const TaskId id = d.id;
        auto it = std::find_if(_entries.begin(), _entries.end(),
                               [id](const Entry &e) { return e.id == id; });
        if (it == _entries.end())
            continue; // cancelled by an earlier task of this batch

        Task task = std::move(it->task);
        _entries.erase(it);
        task();
        ++executed;
    }

    return executed;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize DeferredScheduler::pendingCount() const noexcept { return _entries.size(); }

bool DeferredScheduler::isPending(TaskId id) const noexcept
{
    return std::any_of(_entries.begin(), _entries.end(),
                       [id](const Entry &e) { return e.id == id; });
}

} // namespace rpl::concurrency
