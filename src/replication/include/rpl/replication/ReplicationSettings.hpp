// /////////////////////////////////////////////////////////////////////////////
/// @file ReplicationSettings.hpp
/// @brief Tunables of one replicated entity.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/core/Constants.hpp>
#include <rpl/core/Types.hpp>

#include <vector>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @struct ReplicationSettings
/// @brief Plain value handed to every entity by the owning participant.
// /////////////////////////////////////////////////////////////////////////////
struct ReplicationSettings
{
    /// @brief Horizontal interpolation rate, per second.
    core::f32 positionLerpRate{core::kPositionLerpRate};

    /// @brief Rotation slerp rate, per second.
    core::f32 rotationLerpRate{core::kRotationLerpRate};

    /// @brief Planar divergence above which the replica snaps.
    core::f32 snapDistance{core::kSnapDistance};

    core::f32 maxHealth{core::kMaxHealth};

    /// @brief Seconds between death and network teardown.
    core::f64 teardownDelay{core::kTeardownDelay};

    /// @brief Ticks between the first and second exclusivity pass.
    core::u32 secondPassTickDelay{core::kSecondPassTickDelay};

    /// @brief Seconds after activation at which invariants are re-checked.
    std::vector<core::f64> recheckOffsets{0.5, 1.5, 3.0};
};

} // namespace rpl::replication
