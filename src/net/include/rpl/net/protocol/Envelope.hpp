// /////////////////////////////////////////////////////////////////////////////
/// @file Envelope.hpp
/// @brief One replication message: header plus payload bits.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/net/protocol/Bitstream.hpp>
#include <rpl/net/protocol/Protocol.hpp>

#include <rpl/core/Expected.hpp>

#include <span>
#include <vector>

namespace rpl::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Envelope
/// @brief Decoded message as delivered by a transport.
// /////////////////////////////////////////////////////////////////////////////
struct Envelope
{
    MessageHeader           header;
    std::vector<core::byte> payload;

    /// @brief Builds an envelope from a written payload stream.
    [[nodiscard]] static Envelope make(MessageKind kind, ParticipantId sender,
                                       EntityId entity, const Bitstream &payload);

    /// @brief Read-only view over the payload bits.
    [[nodiscard]] Bitstream payloadStream() const;

    /// @brief Serializes header and payload to wire bytes.
    [[nodiscard]] std::vector<core::byte> encode() const;

    /// @brief Parses wire bytes.
    /// @return kProtocolViolation on bad magic, version or kind, or when the
    ///         declared payload exceeds kMaxPayloadBytes;
    ///         kOutOfRange when the buffer is truncated.
    [[nodiscard]] static core::Expected<Envelope> decode(std::span<const core::byte> bytes);
};

} // namespace rpl::net::protocol
