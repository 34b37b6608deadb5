/**
 * @file Envelope.cpp
 * @brief Envelope wire codec and message-kind helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/net/protocol/Envelope.hpp>

#include <rpl/core/Constants.hpp>

#include <string>

namespace rpl::net::protocol {

std::string_view toString(MessageKind kind) noexcept
{
    switch (kind)
    {
    case MessageKind::Snapshot:       return "Snapshot";
    case MessageKind::CommandRequest: return "CommandRequest";
    case MessageKind::Teardown:       return "Teardown";
    }
    return "Unknown";
}

bool isKnownKind(core::u8 raw) noexcept
{
    switch (static_cast<MessageKind>(raw))
    {
    case MessageKind::Snapshot:
    case MessageKind::CommandRequest:
    case MessageKind::Teardown:
        return true;
    }
    return false;
}

Envelope Envelope::make(MessageKind kind, ParticipantId sender, EntityId entity,
                        const Bitstream &payload)
{
    Envelope env;
    env.header.kind        = kind;
    env.header.sender      = sender;
    env.header.entity      = entity;
    env.header.flags       = MessageFlag::Reliable | MessageFlag::Ordered;
    env.header.payloadBits = payload.bitsWritten();
    const auto bytes = payload.data();
    env.payload.assign(bytes.begin(), bytes.end());
    return env;
}

Bitstream Envelope::payloadStream() const
{
    return Bitstream{payload, header.payloadBits};
}

std::vector<core::byte> Envelope::encode() const
{
    Bitstream out;
    out.writeU32(header.magic);
    out.writeU8(header.version);
    out.writeU8(static_cast<core::u8>(header.kind));
    out.writeU8(header.flags);
    out.writeU8(header.padding);
    out.writeU32(header.sender);
    out.writeU32(header.entity);
    out.writeU32(header.payloadBits);
    out.writeBytes(payload);

    const auto bytes = out.data();
    return {bytes.begin(), bytes.end()};
}

core::Expected<Envelope> Envelope::decode(std::span<const core::byte> bytes)
{
    Bitstream in{bytes, static_cast<core::u32>(bytes.size() * 8)};

    Envelope env;
    env.header.magic = RPL_TRY(in.readU32());
    if (env.header.magic != kProtocolMagic)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "Envelope: bad magic");
    }

    env.header.version = RPL_TRY(in.readU8());
    if (env.header.version != kProtocolVersion)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "Envelope: unsupported version " + std::to_string(env.header.version));
    }

    const core::u8 rawKind = RPL_TRY(in.readU8());
    if (!isKnownKind(rawKind))
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "Envelope: unknown message kind " + std::to_string(rawKind));
    }
    env.header.kind        = static_cast<MessageKind>(rawKind);
    env.header.flags       = RPL_TRY(in.readU8());
    env.header.padding     = RPL_TRY(in.readU8());
    env.header.sender      = RPL_TRY(in.readU32());
    env.header.entity      = RPL_TRY(in.readU32());
    env.header.payloadBits = RPL_TRY(in.readU32());
    if (env.header.payloadBits > core::kMaxPayloadBytes * 8)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "Envelope: payload of " + std::to_string(env.header.payloadBits) +
                               " bits exceeds the limit");
    }

    const core::u32 payloadBytes = (env.header.payloadBits + 7) / 8;
    env.payload = RPL_TRY(in.readBytes(payloadBytes));
    return env;
}

} // namespace rpl::net::protocol
