// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract transport layer interface (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/net/protocol/Bitstream.hpp>
#include <rpl/net/protocol/Envelope.hpp>
#include <rpl/net/session/SessionInfo.hpp>

#include <rpl/core/Types.hpp>
#include <rpl/core/Expected.hpp>

#include <functional>

namespace rpl::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Strategy interface for the session transport.
///
/// A transport provides, per entity, an ordered channel from the authority
/// to every other participant and a reliable request path from any
/// participant to the authority.  It reports who is connected and who the
/// authority is.
///
/// Concrete implementations:
///   - @c LoopbackTransport : in-process hub, used by tests and the demo.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    using DeliverFn = std::function<void(const protocol::Envelope &)>;

    virtual ~ITransport() = default;

    /// @brief Current session state as seen by this participant.
    [[nodiscard]] virtual session::SessionInfo sessionInfo() const = 0;

    /// @brief Sends @p payload to every other connected participant.
    [[nodiscard]] virtual core::Expected<void> broadcast(
        protocol::MessageKind kind,
        protocol::EntityId entity,
        const protocol::Bitstream &payload) = 0;

    /// @brief Sends @p payload to the authority participant only.
    [[nodiscard]] virtual core::Expected<void> sendToAuthority(
        protocol::MessageKind kind,
        protocol::EntityId entity,
        const protocol::Bitstream &payload) = 0;

    /// @brief Delivers every pending message, in arrival order.
    /// @return Number of messages delivered.
    [[nodiscard]] virtual core::Expected<core::u32> poll(const DeliverFn &deliver) = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

} // namespace rpl::net::transport
