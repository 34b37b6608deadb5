// /////////////////////////////////////////////////////////////////////////////
/// @file ReconciliationEngine.hpp
/// @brief Replica-side interpolate-or-snap toward the latest snapshot.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>
#include <rpl/replication/ReplicationSettings.hpp>

#include <rpl/core/NonCopyable.hpp>

#include <optional>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class ReconciliationEngine
/// @brief Turns received snapshots into a smoothly moving presentation.
///
/// Per tick:
///   - planar distance above snapDistance, or first snapshot ever: snap;
///   - otherwise x/z lerp by clamp(dt * positionLerpRate, 0, 1), y copied;
///   - rotation slerp by clamp(dt * rotationLerpRate, 0, 1);
///   - result recorded as lastGoodPosition.
// /////////////////////////////////////////////////////////////////////////////
class ReconciliationEngine final : public core::NonCopyable<ReconciliationEngine>
{
public:
    explicit ReconciliationEngine(const ReplicationSettings &settings);
    ~ReconciliationEngine();

    /// @brief Stores @p snapshot as the target, replacing any older one.
    void onSnapshot(const Snapshot &snapshot);

    /// @brief One reconciliation step from @p current toward @p snapshot.
    [[nodiscard]] Transform reconcile(const Transform &current, const Snapshot &snapshot, core::f32 dt);

    /// @brief Reconciles toward the stored target.
    ///
    /// Once armed, the step starts from lastGoodPosition rather than from
    /// @p current's position, so writes made since the last step are ignored.
    /// @return Nothing before the first snapshot arrives.
    [[nodiscard]] std::optional<Transform> update(const Transform &current, core::f32 dt);

    [[nodiscard]] const PresentationState &presentation() const noexcept;
    [[nodiscard]] bool                     hasTarget() const noexcept;
    [[nodiscard]] core::u64                snapCount() const noexcept;

    /// @brief Forgets all presentation state; the next snapshot snaps.
    void reset() noexcept;

private:
    const ReplicationSettings &_settings;
    PresentationState          _presentation;
    core::u64                  _snaps{0};
};

} // namespace rpl::replication
