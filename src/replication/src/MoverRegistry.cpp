/**
 * @file MoverRegistry.cpp
 * @brief MoverRegistry implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/MoverRegistry.hpp>

#include <rpl/core/Log.hpp>

#include <algorithm>
#include <string>

namespace rpl::replication {

MoverRegistry::MoverRegistry() = default;
MoverRegistry::~MoverRegistry() = default;

void MoverRegistry::add(ILocalMover &mover)
{
    if (std::find(_movers.begin(), _movers.end(), &mover) == _movers.end())
        _movers.push_back(&mover);
}

bool MoverRegistry::remove(ILocalMover &mover)
{
    auto it = std::find(_movers.begin(), _movers.end(), &mover);
    if (it == _movers.end())
        return false;
    _movers.erase(it);
    return true;
}

core::u32 MoverRegistry::suspendAll()
{
    core::u32 suspended = 0;
    for (auto *mover : _movers)
    {
        if (!mover->active())
            continue;
        mover->suspend();
        ++suspended;
        core::Log::info("REPL", "MoverRegistry: suspended local mover '" + std::string{mover->name()} + "'");
    }
    return suspended;
}

core::usize MoverRegistry::size() const noexcept { return _movers.size(); }

core::u32 MoverRegistry::activeCount() const noexcept
{
    return static_cast<core::u32>(std::count_if(_movers.begin(), _movers.end(),
                                                [](const ILocalMover *m) { return m->active(); }));
}

} // namespace rpl::replication
