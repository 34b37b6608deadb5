// /////////////////////////////////////////////////////////////////////////////
/// @file ILocalMover.hpp
/// @brief Opt-in contract for local subsystems that move an entity.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string_view>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class ILocalMover
/// @brief A path follower, root-motion source or integrator.
///
/// On a replica every registered mover is suspended at activation and at
/// each re-check.  A mover may re-activate itself later; re-checks catch it.
// /////////////////////////////////////////////////////////////////////////////
class ILocalMover
{
public:
    virtual ~ILocalMover() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual bool active() const noexcept = 0;
    virtual void suspend() = 0;
};

} // namespace rpl::replication
