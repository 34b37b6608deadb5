/**
 * @file Protocol.hpp
 * @brief Wire protocol constants, message kinds, and header layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RPL_NET_PROTOCOL_PROTOCOL_HPP
    #define RPL_NET_PROTOCOL_PROTOCOL_HPP

#include <rpl/core/Types.hpp>

#include <string_view>

namespace rpl::net::protocol {

/** @brief Network-wide identifier of a replicated entity. */
using EntityId = core::u32;

/** @brief Identifier of a session participant; 0 means "nobody". */
using ParticipantId = core::u32;

inline constexpr EntityId      kInvalidEntity  = 0;
inline constexpr ParticipantId kNoParticipant  = 0;

/**
 * @brief Magic bytes identifying replication messages on the wire.
 */
static constexpr core::u32 kProtocolMagic = 0x52504C00;

/** @brief Current protocol version. */
static constexpr core::u8 kProtocolVersion = 1;

/**
 * @enum MessageKind
 * @brief Exhaustive list of messages exchanged between participants.
 */
enum class MessageKind : core::u8
{
    Snapshot       = 0x11,
    CommandRequest = 0x12,
    Teardown       = 0x21
};

[[nodiscard]] std::string_view toString(MessageKind kind) noexcept;

/** @brief True when @p raw names a known MessageKind. */
[[nodiscard]] bool isKnownKind(core::u8 raw) noexcept;

/**
 * @struct MessageHeader
 * @brief Fixed-size header prepended to every message.
 *
 * Layout (20 bytes, big-endian on the wire):
 *   [magic:4][version:1][kind:1][flags:1][pad:1][sender:4][entity:4][payloadBits:4]
 */
struct MessageHeader
{
    core::u32     magic{kProtocolMagic};
    core::u8      version{kProtocolVersion};
    MessageKind   kind{MessageKind::Snapshot};
    core::u8      flags{0};
    core::u8      padding{0};
    ParticipantId sender{kNoParticipant};
    EntityId      entity{kInvalidEntity};
    core::u32     payloadBits{0};
};

static_assert(sizeof(MessageHeader) == 20, "MessageHeader must be 20 bytes");

inline constexpr core::u32 kHeaderBytes = 20;

/**
 * @enum MessageFlag
 * @brief Bit-flags stored in MessageHeader::flags.
 */
enum class MessageFlag : core::u8
{
    None       = 0x00,
    Reliable   = 0x01,
    Ordered    = 0x02
};

[[nodiscard]] inline constexpr core::u8 operator|(MessageFlag a, MessageFlag b) noexcept
{
    return static_cast<core::u8>(static_cast<core::u8>(a) | static_cast<core::u8>(b));
}

[[nodiscard]] inline constexpr bool hasFlag(core::u8 flags, MessageFlag f) noexcept
{
    return (flags & static_cast<core::u8>(f)) != 0;
}

} // namespace rpl::net::protocol

#endif // RPL_NET_PROTOCOL_PROTOCOL_HPP
