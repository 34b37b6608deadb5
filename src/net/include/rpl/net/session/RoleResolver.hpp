// /////////////////////////////////////////////////////////////////////////////
/// @file RoleResolver.hpp
/// @brief Decides once per entity whether this participant is authority.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/net/session/SessionInfo.hpp>

#include <rpl/core/Types.hpp>

#include <string_view>

namespace rpl::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @enum Role
/// @brief Role of the local participant for one entity, fixed at creation.
// /////////////////////////////////////////////////////////////////////////////
enum class Role : core::u8
{
    Authority,
    Replica
};

[[nodiscard]] std::string_view toString(Role role) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class RoleResolver
/// @brief Pure mapping from session state to Role.
///
/// Not connected, or no authority known yet: the local participant is the
/// sole authority (solo mode).  Otherwise Authority exactly when the local
/// participant is the session authority.
// /////////////////////////////////////////////////////////////////////////////
class RoleResolver final
{
public:
    RoleResolver() = delete;

    [[nodiscard]] static Role resolve(const SessionInfo &info) noexcept;

    /// @brief True when no networked session is active.
    [[nodiscard]] static bool isSolo(const SessionInfo &info) noexcept;
};

} // namespace rpl::net::session
