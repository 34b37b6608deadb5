/**
 * @file TestEnvelope.cpp
 * @brief Unit tests for the message envelope codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/core/Constants.hpp>
#include <rpl/net/protocol/Envelope.hpp>

using namespace rpl::net::protocol;
using namespace rpl::core;

TEST_CASE("Envelope carries header fields and payload", "[net][envelope]")
{
    Bitstream payload;
    payload.writeF32(42.5f);
    payload.writeBool(true);

    const auto env   = Envelope::make(MessageKind::Snapshot, 2, 77, payload);
    const auto bytes = env.encode();
    REQUIRE(bytes.size() == kHeaderBytes + 5);

    auto decoded = Envelope::decode(bytes);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->header.kind == MessageKind::Snapshot);
    REQUIRE(decoded->header.sender == 2);
    REQUIRE(decoded->header.entity == 77);
    REQUIRE(decoded->header.payloadBits == 33);
    REQUIRE(hasFlag(decoded->header.flags, MessageFlag::Ordered));

    auto in = decoded->payloadStream();
    REQUIRE(in.readF32().value() == 42.5f);
    REQUIRE(in.readBool().value());
    REQUIRE(in.bitsRemaining() == 0);
}

TEST_CASE("Envelope rejects foreign or malformed bytes", "[net][envelope]")
{
    Bitstream empty;
    auto bytes = Envelope::make(MessageKind::Teardown, 1, 5, empty).encode();

    SECTION("bad magic")
    {
        bytes[0] = byte{0x00};
        auto r = Envelope::decode(bytes);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == ErrorCode::kProtocolViolation);
    }

    SECTION("bad version")
    {
        bytes[4] = byte{9};
        auto r = Envelope::decode(bytes);
        REQUIRE(r.error().code() == ErrorCode::kProtocolViolation);
    }

    SECTION("unknown kind")
    {
        bytes[5] = byte{0x7F};
        auto r = Envelope::decode(bytes);
        REQUIRE(r.error().code() == ErrorCode::kProtocolViolation);
    }

    SECTION("truncated")
    {
        bytes.resize(10);
        auto r = Envelope::decode(bytes);
        REQUIRE(r.error().code() == ErrorCode::kOutOfRange);
    }

    SECTION("payload length beyond the limit")
    {
        bytes[16] = byte{0xFF};
        bytes[17] = byte{0xFF};
        bytes[18] = byte{0xFF};
        bytes[19] = byte{0xFF};
        auto r = Envelope::decode(bytes);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == ErrorCode::kProtocolViolation);
    }
}

TEST_CASE("Envelope accepts a payload at the size limit", "[net][envelope]")
{
    Bitstream payload;
    for (u32 i = 0; i < kMaxPayloadBytes; ++i)
        payload.writeU8(static_cast<u8>(i));

    const auto bytes = Envelope::make(MessageKind::CommandRequest, 1, 3, payload).encode();
    auto decoded     = Envelope::decode(bytes);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->payload.size() == kMaxPayloadBytes);

    auto oversized = bytes;
    oversized.push_back(byte{0});
    oversized[18] = byte{0x08};
    oversized[19] = byte{0x01};
    REQUIRE(Envelope::decode(oversized).error().code() == ErrorCode::kProtocolViolation);
}
