// /////////////////////////////////////////////////////////////////////////////
/// @file CommandForwarder.hpp
/// @brief Routes mutation requests to the authority.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>
#include <rpl/replication/MutationApplier.hpp>

#include <rpl/net/protocol/Bitstream.hpp>
#include <rpl/net/session/RoleResolver.hpp>
#include <rpl/net/transport/ITransport.hpp>

#include <rpl/core/Expected.hpp>
#include <rpl/core/NonCopyable.hpp>

namespace rpl::replication {

using net::session::Role;

// /////////////////////////////////////////////////////////////////////////////
/// @struct CommandRequest
/// @brief In-flight damage request.  senderId travels in the envelope.
// /////////////////////////////////////////////////////////////////////////////
struct CommandRequest
{
    core::f32                    amount{0.0f};
    Vec3f                        position{};
    Vec3f                        direction{};
    net::protocol::ParticipantId senderId{net::protocol::kNoParticipant};

    void write(net::protocol::Bitstream &out) const;
    [[nodiscard]] static core::Expected<CommandRequest> read(net::protocol::Bitstream &in,
                                                             net::protocol::ParticipantId sender);
};

// /////////////////////////////////////////////////////////////////////////////
/// @class CommandForwarder
/// @brief Authority applies in place; a replica sends and forgets.
///
/// The result of a forwarded request only comes back through snapshots.
// /////////////////////////////////////////////////////////////////////////////
class CommandForwarder final : public core::NonCopyable<CommandForwarder>
{
public:
    /// @param transport Null in solo mode.
    /// @param applier   Required on the authority, null on a replica.
    CommandForwarder(EntityId entity, Role role,
                     net::transport::ITransport *transport,
                     MutationApplier *applier);
    ~CommandForwarder();

    /// @brief Applies (authority) or forwards (replica) a damage request.
    [[nodiscard]] core::Expected<void> requestMutation(core::f32 amount, Vec3f position,
                                                       Vec3f direction, AttackerId attacker);

    /// @brief Authority side of a forwarded request.
    /// @return kProtocolViolation on a replica.
    [[nodiscard]] core::Expected<MutationResult> onCommandReceived(net::protocol::Bitstream &payload,
                                                                   net::protocol::ParticipantId sender);

    [[nodiscard]] core::u64 forwardedCount() const noexcept;
    [[nodiscard]] core::u64 appliedLocallyCount() const noexcept;
    [[nodiscard]] core::u64 receivedCount() const noexcept;

private:
    EntityId                    _entity;
    Role                        _role;
    net::transport::ITransport *_transport;
    MutationApplier            *_applier;
    core::u64                   _forwarded{0};
    core::u64                   _appliedLocally{0};
    core::u64                   _received{0};
};

} // namespace rpl::replication
