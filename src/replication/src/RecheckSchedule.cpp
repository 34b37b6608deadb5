/**
 * @file RecheckSchedule.cpp
 * @brief RecheckSchedule implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/RecheckSchedule.hpp>

#include <rpl/core/Log.hpp>

#include <string>

namespace rpl::replication {

RecheckSchedule::RecheckSchedule(concurrency::DeferredScheduler &scheduler,
                                 std::vector<core::f64> offsets,
                                 Check check,
                                 std::string label)
    : _scheduler{scheduler}
    , _offsets{std::move(offsets)}
    , _check{std::move(check)}
    , _label{std::move(label)}
{}

RecheckSchedule::~RecheckSchedule()
{
    cancel();
}

void RecheckSchedule::start()
{
    cancel();
    _attempts = 0;
    _fixes    = 0;
    for (const auto offset : _offsets)
    {
        _pending.push_back(_scheduler.scheduleAfterSeconds(offset, [this] { runAttempt(); }, _label));
    }
}

void RecheckSchedule::cancel()
{
    for (const auto id : _pending)
        _scheduler.cancel(id);
    _pending.clear();
}

void RecheckSchedule::runAttempt()
{
    ++_attempts;
    const core::u32 fixed = _check ? _check() : 0;
    _fixes += fixed;
    if (fixed > 0)
    {
        core::Log::info("REPL", "RecheckSchedule: " + _label + " attempt " + std::to_string(_attempts) +
                                    " repaired " + std::to_string(fixed) + " violation(s)");
    }
    if (finished())
        _pending.clear();
}

bool RecheckSchedule::finished() const noexcept
{
    return _attempts >= static_cast<core::u32>(_offsets.size());
}

core::u32 RecheckSchedule::attemptsMade() const noexcept { return _attempts; }
core::u32 RecheckSchedule::attemptsPlanned() const noexcept { return static_cast<core::u32>(_offsets.size()); }
core::u32 RecheckSchedule::totalFixes() const noexcept { return _fixes; }

} // namespace rpl::replication
