/**
 * @file ReconciliationEngine.cpp
 * @brief ReconciliationEngine implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/ReconciliationEngine.hpp>

#include <rpl/core/Log.hpp>

#include <algorithm>
#include <string>

namespace rpl::replication {

ReconciliationEngine::ReconciliationEngine(const ReplicationSettings &settings)
    : _settings{settings}
{}

ReconciliationEngine::~ReconciliationEngine() = default;

void ReconciliationEngine::onSnapshot(const Snapshot &snapshot)
{
    _presentation.targetSnapshot = snapshot;
}

Transform ReconciliationEngine::reconcile(const Transform &current, const Snapshot &snapshot, core::f32 dt)
{
    Transform next = current;

    const bool      first    = !_presentation.guardArmed;
    const core::f32 distance = math::planarDistance(current.position, snapshot.position);

    if (first || distance > _settings.snapDistance)
    {
        next.position = snapshot.position;
        next.rotation = snapshot.rotation;
        ++_snaps;
        if (!first)
        {
            core::Log::debug("REPL", "ReconciliationEngine: snap over " + std::to_string(distance) + " m");
        }
    }
    else
    {
        const core::f32 t = std::clamp(dt * _settings.positionLerpRate, 0.0f, 1.0f);
        next.position.x = current.position.x + (snapshot.position.x - current.position.x) * t;
        next.position.z = current.position.z + (snapshot.position.z - current.position.z) * t;
        next.position.y = snapshot.position.y;

        const core::f32 r = std::clamp(dt * _settings.rotationLerpRate, 0.0f, 1.0f);
        next.rotation = Quatf::slerp(current.rotation, snapshot.rotation, r);
    }

    _presentation.currentPosition  = next.position;
    _presentation.currentRotation  = next.rotation;
    _presentation.lastGoodPosition = next.position;
    _presentation.guardArmed       = true;
    return next;
}

std::optional<Transform> ReconciliationEngine::update(const Transform &current, core::f32 dt)
{
    if (!_presentation.targetSnapshot)
        return std::nullopt;

    Transform from = current;
    if (_presentation.guardArmed)
    {
        from.position = _presentation.lastGoodPosition;
    }
    return reconcile(from, *_presentation.targetSnapshot, dt);
}

const PresentationState &ReconciliationEngine::presentation() const noexcept { return _presentation; }

bool ReconciliationEngine::hasTarget() const noexcept { return _presentation.targetSnapshot.has_value(); }

core::u64 ReconciliationEngine::snapCount() const noexcept { return _snaps; }

void ReconciliationEngine::reset() noexcept
{
    _presentation = PresentationState{};
    _snaps        = 0;
}

} // namespace rpl::replication
