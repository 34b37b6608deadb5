// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.hpp
/// @brief In-process transport connecting several participants through a
///        shared hub.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/net/transport/ITransport.hpp>

#include <rpl/core/NonCopyable.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace rpl::net::transport {

class LoopbackTransport;

// /////////////////////////////////////////////////////////////////////////////
/// @class LoopbackHub
/// @brief Shared message router; owns one FIFO inbox per participant.
///
/// Messages are encoded to wire bytes on send and decoded on poll, so the
/// full codec runs.  An optional filter can drop messages in flight.
// /////////////////////////////////////////////////////////////////////////////
class LoopbackHub final : public core::NonCopyable<LoopbackHub>
{
public:
    /// @brief Returns true to deliver the message to @p to, false to drop it.
    using Filter = std::function<bool(const protocol::Envelope &, protocol::ParticipantId to)>;

    LoopbackHub();
    ~LoopbackHub();

    /// @brief Connects a participant and returns its transport endpoint.
    [[nodiscard]] std::unique_ptr<LoopbackTransport> connect(protocol::ParticipantId id);

    /// @brief Removes a participant; its pending messages are discarded.
    void disconnect(protocol::ParticipantId id);

    /// @brief Sets the session authority (kNoParticipant clears it).
    void setAuthority(protocol::ParticipantId id) noexcept;

    [[nodiscard]] protocol::ParticipantId authority() const noexcept;
    [[nodiscard]] bool isConnected(protocol::ParticipantId id) const;

    void setFilter(Filter filter);

    /// @brief Number of messages dropped by the filter so far.
    [[nodiscard]] core::u64 droppedCount() const noexcept;

    /// @brief Number of messages waiting in @p id's inbox.
    [[nodiscard]] core::usize pending(protocol::ParticipantId id) const;

private:
    friend class LoopbackTransport;

    core::Expected<void> route(const protocol::Envelope &env, protocol::ParticipantId to);
    std::deque<std::vector<core::byte>> *inbox(protocol::ParticipantId id);

    std::unordered_map<protocol::ParticipantId, std::deque<std::vector<core::byte>>> _inboxes;
    std::vector<protocol::ParticipantId> _order;
    protocol::ParticipantId              _authority{protocol::kNoParticipant};
    Filter                               _filter;
    core::u64                            _dropped{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class LoopbackTransport
/// @brief One participant's endpoint on a LoopbackHub.
// /////////////////////////////////////////////////////////////////////////////
class LoopbackTransport final : public ITransport, public core::NonCopyable<LoopbackTransport>
{
public:
    LoopbackTransport(LoopbackHub &hub, protocol::ParticipantId id);
    ~LoopbackTransport() override;

    [[nodiscard]] session::SessionInfo sessionInfo() const override;

    [[nodiscard]] core::Expected<void> broadcast(
        protocol::MessageKind kind,
        protocol::EntityId entity,
        const protocol::Bitstream &payload) override;

    [[nodiscard]] core::Expected<void> sendToAuthority(
        protocol::MessageKind kind,
        protocol::EntityId entity,
        const protocol::Bitstream &payload) override;

    [[nodiscard]] core::Expected<core::u32> poll(const DeliverFn &deliver) override;

    [[nodiscard]] const char *name() const noexcept override;

    [[nodiscard]] protocol::ParticipantId localId() const noexcept;

private:
    LoopbackHub            &_hub;
    protocol::ParticipantId _id;
};

} // namespace rpl::net::transport
