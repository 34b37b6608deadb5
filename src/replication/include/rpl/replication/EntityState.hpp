// /////////////////////////////////////////////////////////////////////////////
/// @file EntityState.hpp
/// @brief State records of a replicated entity.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/math/Quat.hpp>
#include <rpl/math/Vec3.hpp>
#include <rpl/net/protocol/Protocol.hpp>

#include <rpl/core/Types.hpp>

#include <optional>

namespace rpl::replication {

using math::Quatf;
using math::Vec3f;
using net::protocol::EntityId;

/// @brief Whoever caused a mutation (a participant, on the wire).
using AttackerId = net::protocol::ParticipantId;

/** @brief Position and orientation of an entity. */
struct Transform
{
    Vec3f position{};
    Quatf rotation{Quatf::identity()};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct GroundTruthState
/// @brief Authoritative state, written only on the authority.
///
/// isDead == (health <= 0) after every mutation.
// /////////////////////////////////////////////////////////////////////////////
struct GroundTruthState
{
    Vec3f     position{};
    Quatf     rotation{Quatf::identity()};
    core::f32 health{0.0f};
    bool      isDead{false};

    [[nodiscard]] bool isConsistent() const noexcept { return isDead == (health <= 0.0f); }
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct Snapshot
/// @brief Immutable copy of GroundTruthState taken at serialization time.
// /////////////////////////////////////////////////////////////////////////////
struct Snapshot
{
    Vec3f     position{};
    Quatf     rotation{Quatf::identity()};
    core::f32 health{0.0f};
    bool      isDead{false};

    [[nodiscard]] static Snapshot capture(const GroundTruthState &state) noexcept
    {
        return Snapshot{state.position, state.rotation, state.health, state.isDead};
    }
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PresentationState
/// @brief What the local process shows; written by reconciliation only.
// /////////////////////////////////////////////////////////////////////////////
struct PresentationState
{
    Vec3f                   currentPosition{};
    Quatf                   currentRotation{Quatf::identity()};

    /// @brief Position the authority guard stamps back every tick.
    Vec3f                   lastGoodPosition{};

    /// @brief Latest snapshot received (most recent wins).
    std::optional<Snapshot> targetSnapshot;

    /// @brief False until the first reconciliation has run.
    bool                    guardArmed{false};
};

} // namespace rpl::replication
