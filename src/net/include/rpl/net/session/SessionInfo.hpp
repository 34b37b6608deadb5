// /////////////////////////////////////////////////////////////////////////////
/// @file SessionInfo.hpp
/// @brief What the transport knows about the current session.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/net/protocol/Protocol.hpp>

namespace rpl::net::session {

using protocol::ParticipantId;
using protocol::kNoParticipant;

// /////////////////////////////////////////////////////////////////////////////
/// @struct SessionInfo
/// @brief Connection state and the identity of the authority participant.
// /////////////////////////////////////////////////////////////////////////////
struct SessionInfo
{
    bool          connected{false};
    ParticipantId localId{kNoParticipant};
    ParticipantId authorityId{kNoParticipant};
};

} // namespace rpl::net::session
