// /////////////////////////////////////////////////////////////////////////////
/// @file IReplicatedBody.hpp
/// @brief The one transform hook a replicated entity exposes.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class IReplicatedBody
/// @brief Live transform of an entity in the host world.
///
/// Reconciliation and the authority guard write through setTransform().
/// freezeSimulation() asks the host to stop integrating the body (forces,
/// gravity, velocity) so only replicated truth moves it.
// /////////////////////////////////////////////////////////////////////////////
class IReplicatedBody
{
public:
    virtual ~IReplicatedBody() = default;

    [[nodiscard]] virtual Transform transform() const = 0;
    virtual void setTransform(const Transform &transform) = 0;
    virtual void freezeSimulation() = 0;
};

} // namespace rpl::replication
