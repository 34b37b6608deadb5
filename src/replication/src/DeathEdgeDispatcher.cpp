/**
 * @file DeathEdgeDispatcher.cpp
 * @brief DeathEdgeDispatcher implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/DeathEdgeDispatcher.hpp>

namespace rpl::replication {

DeathEdgeDispatcher::DeathEdgeDispatcher(Callback onDeath)
    : _onDeath{std::move(onDeath)}
{}

bool DeathEdgeDispatcher::onSnapshotApplied(bool previousIsDead, bool newIsDead)
{
    if (previousIsDead || !newIsDead || _fired)
        return false;

    _fired = true;
    ++_fireCount;
    if (_onDeath)
        _onDeath();
    return true;
}

void DeathEdgeDispatcher::reset() noexcept { _fired = false; }

} // namespace rpl::replication
