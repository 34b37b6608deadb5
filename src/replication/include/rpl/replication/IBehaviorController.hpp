// /////////////////////////////////////////////////////////////////////////////
/// @file IBehaviorController.hpp
/// @brief Hooks the replication layer calls on the behavior controller.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class IBehaviorController
/// @brief Decision logic of the entity, external to this layer.
// /////////////////////////////////////////////////////////////////////////////
class IBehaviorController
{
public:
    virtual ~IBehaviorController() = default;

    /// @brief Enables or disables the controller's own simulation.
    virtual void setSimulationEnabled(bool enabled) = 0;

    /// @brief Entity died.  Called even when simulation is disabled.
    virtual void notifyDeath() = 0;
};

} // namespace rpl::replication
