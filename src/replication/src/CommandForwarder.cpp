/**
 * @file CommandForwarder.cpp
 * @brief CommandForwarder and CommandRequest codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/CommandForwarder.hpp>

#include <rpl/core/Assert.hpp>
#include <rpl/core/Log.hpp>

#include <string>

namespace rpl::replication {

// -------------------------------------------------------------------------- //
//  CommandRequest                                                            //
// -------------------------------------------------------------------------- //

void CommandRequest::write(net::protocol::Bitstream &out) const
{
    out.writeF32(amount);
    out.writeF32(position.x);
    out.writeF32(position.y);
    out.writeF32(position.z);
    out.writeF32(direction.x);
    out.writeF32(direction.y);
    out.writeF32(direction.z);
}

core::Expected<CommandRequest> CommandRequest::read(net::protocol::Bitstream &in,
                                                    net::protocol::ParticipantId sender)
{
    CommandRequest req;
    req.amount      = RPL_TRY(in.readF32());
    req.position.x  = RPL_TRY(in.readF32());
    req.position.y  = RPL_TRY(in.readF32());
    req.position.z  = RPL_TRY(in.readF32());
    req.direction.x = RPL_TRY(in.readF32());
    req.direction.y = RPL_TRY(in.readF32());
    req.direction.z = RPL_TRY(in.readF32());
    req.senderId    = sender;
    return req;
}

// -------------------------------------------------------------------------- //
//  CommandForwarder                                                          //
// -------------------------------------------------------------------------- //

CommandForwarder::CommandForwarder(EntityId entity, Role role,
                                   net::transport::ITransport *transport,
                                   MutationApplier *applier)
    : _entity{entity}
    , _role{role}
    , _transport{transport}
    , _applier{applier}
{
    RPL_ASSERT(role == Role::Replica || applier != nullptr);
}

CommandForwarder::~CommandForwarder() = default;

core::Expected<void> CommandForwarder::requestMutation(core::f32 amount, Vec3f position,
                                                       Vec3f direction, AttackerId attacker)
{
    if (_role == Role::Authority)
    {
        if (!_applier)
            return core::makeError(core::ErrorCode::kInvalidState, "CommandForwarder: authority without applier");

        auto result = _applier->apply(MutationCommand{amount, position, direction, attacker});
        if (!result)
            return std::unexpected(result.error());
        ++_appliedLocally;
        return {};
    }

    if (!_transport)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "CommandForwarder: replica without transport");
    }

    net::protocol::Bitstream payload;
    CommandRequest{amount, position, direction, attacker}.write(payload);
    RPL_TRY_VOID(_transport->sendToAuthority(net::protocol::MessageKind::CommandRequest, _entity, payload));
    ++_forwarded;
    core::Log::debug("REPL", "CommandForwarder: entity " + std::to_string(_entity) + " forwarded " +
                                 std::to_string(amount) + " damage to authority");
    return {};
}

core::Expected<MutationResult> CommandForwarder::onCommandReceived(net::protocol::Bitstream &payload,
                                                                   net::protocol::ParticipantId sender)
{
    if (_role != Role::Authority || !_applier)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "CommandForwarder: command request delivered to a replica");
    }

    const CommandRequest req = RPL_TRY(CommandRequest::read(payload, sender));
    ++_received;
    return _applier->apply(MutationCommand{req.amount, req.position, req.direction, req.senderId});
}

core::u64 CommandForwarder::forwardedCount() const noexcept { return _forwarded; }
core::u64 CommandForwarder::appliedLocallyCount() const noexcept { return _appliedLocally; }
core::u64 CommandForwarder::receivedCount() const noexcept { return _received; }

} // namespace rpl::replication
