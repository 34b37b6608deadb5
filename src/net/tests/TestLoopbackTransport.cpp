/**
 * @file TestLoopbackTransport.cpp
 * @brief Unit tests for the in-process loopback transport.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/net/transport/LoopbackTransport.hpp>

#include <vector>

using namespace rpl::net;
using namespace rpl::net::protocol;
using namespace rpl::net::transport;
using namespace rpl::core;

namespace {

Bitstream payloadOf(u32 value)
{
    Bitstream bs;
    bs.writeU32(value);
    return bs;
}

} // namespace

TEST_CASE("Broadcast reaches every other participant in order", "[net][loopback]")
{
    LoopbackHub hub;
    auto a = hub.connect(1);
    auto b = hub.connect(2);
    auto c = hub.connect(3);
    hub.setAuthority(1);

    REQUIRE(a->broadcast(MessageKind::Snapshot, 10, payloadOf(1)).has_value());
    REQUIRE(a->broadcast(MessageKind::Snapshot, 10, payloadOf(2)).has_value());
    REQUIRE(hub.pending(1) == 0);

    std::vector<u32> seen;
    auto n = b->poll([&](const Envelope &env) {
        REQUIRE(env.header.sender == 1);
        seen.push_back(env.payloadStream().readU32().value());
    });
    REQUIRE(n.value() == 2);
    REQUIRE(seen == std::vector<u32>{1, 2});
    REQUIRE(hub.pending(3) == 2);
}

TEST_CASE("sendToAuthority targets only the authority", "[net][loopback]")
{
    LoopbackHub hub;
    auto a = hub.connect(1);
    auto b = hub.connect(2);
    auto c = hub.connect(3);

    auto none = b->sendToAuthority(MessageKind::CommandRequest, 10, payloadOf(5));
    REQUIRE(none.error().code() == ErrorCode::kNetworkSendFailed);

    hub.setAuthority(1);
    REQUIRE(b->sendToAuthority(MessageKind::CommandRequest, 10, payloadOf(5)).has_value());
    REQUIRE(hub.pending(1) == 1);
    REQUIRE(hub.pending(3) == 0);

    auto self = a->sendToAuthority(MessageKind::CommandRequest, 10, payloadOf(5));
    REQUIRE(self.error().code() == ErrorCode::kInvalidState);
}

TEST_CASE("Session info follows hub state", "[net][loopback]")
{
    LoopbackHub hub;
    auto a = hub.connect(4);
    REQUIRE(a->sessionInfo().connected);
    REQUIRE(a->sessionInfo().authorityId == kNoParticipant);

    hub.setAuthority(4);
    REQUIRE(a->sessionInfo().authorityId == 4);

    hub.disconnect(4);
    REQUIRE_FALSE(a->sessionInfo().connected);
    REQUIRE(a->sessionInfo().authorityId == kNoParticipant);
    REQUIRE_FALSE(a->poll([](const Envelope &) {}).has_value());
}

TEST_CASE("Filter drops messages in flight", "[net][loopback]")
{
    LoopbackHub hub;
    auto a = hub.connect(1);
    auto b = hub.connect(2);
    hub.setAuthority(1);

    int sent = 0;
    hub.setFilter([&](const Envelope &, ParticipantId) { return (sent++ % 2) == 0; });

    for (u32 i = 0; i < 4; ++i)
        REQUIRE(a->broadcast(MessageKind::Snapshot, 1, payloadOf(i)).has_value());

    REQUIRE(hub.droppedCount() == 2);
    REQUIRE(b->poll([](const Envelope &) {}).value() == 2);
}
