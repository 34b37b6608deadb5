// /////////////////////////////////////////////////////////////////////////////
/// @file RecheckSchedule.hpp
/// @brief Finite series of deferred invariant re-checks.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/concurrency/DeferredScheduler.hpp>

#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <functional>
#include <string>
#include <vector>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class RecheckSchedule
/// @brief Runs a check once at each offset after start(), then stops.
///
/// The check returns how many violations it repaired.
// /////////////////////////////////////////////////////////////////////////////
class RecheckSchedule final : public core::NonCopyable<RecheckSchedule>
{
public:
    using Check = std::function<core::u32()>;

    RecheckSchedule(concurrency::DeferredScheduler &scheduler,
                    std::vector<core::f64> offsets,
                    Check check,
                    std::string label);
    ~RecheckSchedule();

    /// @brief (Re)starts the series relative to the scheduler clock.
    void start();

    /// @brief Cancels every attempt still pending.
    void cancel();

    [[nodiscard]] bool      finished() const noexcept;
    [[nodiscard]] core::u32 attemptsMade() const noexcept;
    [[nodiscard]] core::u32 attemptsPlanned() const noexcept;
    [[nodiscard]] core::u32 totalFixes() const noexcept;

private:
    void runAttempt();

    concurrency::DeferredScheduler     &_scheduler;
    std::vector<core::f64>              _offsets;
    Check                               _check;
    std::string                         _label;
    std::vector<concurrency::TaskId>    _pending;
    core::u32                           _attempts{0};
    core::u32                           _fixes{0};
};

} // namespace rpl::replication
