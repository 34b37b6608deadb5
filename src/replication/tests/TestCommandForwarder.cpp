/**
 * @file TestCommandForwarder.cpp
 * @brief Unit tests for command forwarding between participants.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/replication/CommandForwarder.hpp>

#include <rpl/net/transport/LoopbackTransport.hpp>

using namespace rpl::replication;
using namespace rpl::net;
using rpl::core::ErrorCode;

TEST_CASE("Authority applies requests in place", "[replication][command]")
{
    GroundTruthState state{Vec3f{}, Quatf::identity(), 100.0f, false};
    MutationApplier applier{state, nullptr, {}};
    CommandForwarder forwarder{1, Role::Authority, nullptr, &applier};

    REQUIRE(forwarder.requestMutation(10.0f, Vec3f{}, Vec3f{}, 1).has_value());
    REQUIRE(state.health == 90.0f);
    REQUIRE(forwarder.appliedLocallyCount() == 1);
    REQUIRE(forwarder.forwardedCount() == 0);
}

TEST_CASE("Replica forwards to the authority without local effect", "[replication][command]")
{
    transport::LoopbackHub hub;
    auto authorityEnd = hub.connect(1);
    auto replicaEnd   = hub.connect(2);
    hub.setAuthority(1);

    GroundTruthState authorityState{Vec3f{}, Quatf::identity(), 100.0f, false};
    MutationApplier applier{authorityState, nullptr, {}};
    CommandForwarder onAuthority{5, Role::Authority, authorityEnd.get(), &applier};
    CommandForwarder onReplica{5, Role::Replica, replicaEnd.get(), nullptr};

    REQUIRE(onReplica.requestMutation(10.0f, Vec3f{1.0f, 2.0f, 3.0f}, Vec3f{0.0f, 0.0f, 1.0f}, 2).has_value());
    REQUIRE(onReplica.forwardedCount() == 1);
    REQUIRE(authorityState.health == 100.0f);

    auto delivered = authorityEnd->poll([&](const protocol::Envelope &env) {
        REQUIRE(env.header.kind == protocol::MessageKind::CommandRequest);
        REQUIRE(env.header.entity == 5);
        auto payload = env.payloadStream();
        auto result  = onAuthority.onCommandReceived(payload, env.header.sender);
        REQUIRE(result.value() == MutationResult::kApplied);
    });
    REQUIRE(delivered.value() == 1);
    REQUIRE(authorityState.health == 90.0f);
    REQUIRE(onAuthority.receivedCount() == 1);
}

TEST_CASE("CommandRequest codec keeps every field", "[replication][command]")
{
    protocol::Bitstream out;
    CommandRequest{12.5f, Vec3f{1.0f, 2.0f, 3.0f}, Vec3f{0.0f, -1.0f, 0.0f}, 0}.write(out);

    protocol::Bitstream in{out.data(), out.bitsWritten()};
    auto req = CommandRequest::read(in, 7);
    REQUIRE(req->amount == 12.5f);
    REQUIRE(req->position == Vec3f{1.0f, 2.0f, 3.0f});
    REQUIRE(req->direction == Vec3f{0.0f, -1.0f, 0.0f});
    REQUIRE(req->senderId == 7);
}

TEST_CASE("Replicas refuse inbound commands", "[replication][command]")
{
    CommandForwarder onReplica{5, Role::Replica, nullptr, nullptr};
    protocol::Bitstream out;
    CommandRequest{1.0f, Vec3f{}, Vec3f{}, 0}.write(out);
    protocol::Bitstream in{out.data(), out.bitsWritten()};

    auto r = onReplica.onCommandReceived(in, 3);
    REQUIRE(r.error().code() == ErrorCode::kProtocolViolation);
}

TEST_CASE("Replica without transport reports invalid state", "[replication][command]")
{
    CommandForwarder onReplica{5, Role::Replica, nullptr, nullptr};
    auto r = onReplica.requestMutation(1.0f, Vec3f{}, Vec3f{}, 0);
    REQUIRE(r.error().code() == ErrorCode::kInvalidState);
}
