/**
 * @file RoleResolver.cpp
 * @brief RoleResolver implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/net/session/RoleResolver.hpp>

namespace rpl::net::session {

std::string_view toString(Role role) noexcept
{
    return role == Role::Authority ? "Authority" : "Replica";
}

bool RoleResolver::isSolo(const SessionInfo &info) noexcept
{
    return !info.connected || info.authorityId == kNoParticipant;
}

Role RoleResolver::resolve(const SessionInfo &info) noexcept
{
    if (isSolo(info))
        return Role::Authority;
    return info.localId == info.authorityId ? Role::Authority : Role::Replica;
}

} // namespace rpl::net::session
