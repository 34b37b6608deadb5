/**
 * @file AuthorityGuard.cpp
 * @brief AuthorityGuard implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/AuthorityGuard.hpp>

#include <rpl/core/Log.hpp>

#include <string>

namespace rpl::replication {

std::string_view toString(GuardPhase phase) noexcept
{
    return phase == GuardPhase::PrePhysics ? "PrePhysics" : "PostCallbacks";
}

AuthorityGuard::AuthorityGuard(IReplicatedBody &body, const PresentationState &presentation)
    : _body{body}
    , _presentation{presentation}
{}

AuthorityGuard::~AuthorityGuard() = default;

bool AuthorityGuard::enforce(GuardPhase phase)
{
    if (!_presentation.guardArmed)
        return false;

    Transform live = _body.transform();
    const bool foreign = live.position != _presentation.lastGoodPosition;
    if (foreign)
    {
        ++_corrections[static_cast<core::usize>(phase)];
        if (core::Log::minLevel() <= core::LogLevel::kDebug)
        {
            const core::f32 moved = (live.position - _presentation.lastGoodPosition).length();
            core::Log::debug("REPL", "AuthorityGuard: undid foreign move of " + std::to_string(moved) +
                                         " m at " + std::string{toString(phase)});
        }
    }

    live.position = _presentation.lastGoodPosition;
    _body.setTransform(live);
    ++_enforcements;
    return foreign;
}

core::u64 AuthorityGuard::enforcements() const noexcept { return _enforcements; }

core::u64 AuthorityGuard::corrections(GuardPhase phase) const noexcept
{
    return _corrections[static_cast<core::usize>(phase)];
}

} // namespace rpl::replication
