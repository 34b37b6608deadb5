/**
 * @file TestParticipant.cpp
 * @brief End-to-end tests: two participants sharing one entity over the
 *        loopback transport.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/engine/Participant.hpp>

#include <rpl/core/Constants.hpp>
#include <rpl/core/Log.hpp>

#include <rpl/net/transport/LoopbackTransport.hpp>

#include "Fakes.hpp"

#include <cmath>
#include <vector>

using namespace rpl::engine;
using namespace rpl::replication;
using namespace rpl::replication::test;
using rpl::core::ErrorCode;
using rpl::net::transport::LoopbackHub;

namespace {

constexpr EntityId kEnemy = 7;

/** @brief Host-world objects of one participant. */
struct World
{
    FakeBody        body;
    FakeBehavior    behavior;
    HealthAttribute health{100.0f};
    MoverRegistry   movers;
    FakeMover       nav{"NavAgent"};

    World() { movers.add(nav); }

    EntityBindings bindings() { return EntityBindings{body, &behavior, &health, &movers}; }
};

/** @brief Authority (participant 1) and replica (participant 2) in one hub. */
struct Session
{
    Config      config{Config::Builder{}.build()};
    LoopbackHub hub;
    std::unique_ptr<rpl::net::transport::LoopbackTransport> authorityEnd{hub.connect(1)};
    std::unique_ptr<rpl::net::transport::LoopbackTransport> replicaEnd{hub.connect(2)};
    World       authorityWorld;
    World       replicaWorld;
    Participant authority{config, authorityEnd.get()};
    Participant replica{config, replicaEnd.get()};

    Session()
    {
        hub.setAuthority(1);
        const Transform spawn{Vec3f{3.0f, 0.0f, 0.0f}, Quatf::identity()};
        REQUIRE(authority.spawn(kEnemy, spawn, authorityWorld.bindings()).has_value());
        REQUIRE(replica.spawn(kEnemy, spawn, replicaWorld.bindings()).has_value());
    }

    void run(int ticks)
    {
        const double dt = config.fixedDeltaTime();
        for (int i = 0; i < ticks; ++i)
        {
            authority.tick(dt);
            replica.tick(dt);
        }
    }
};

} // namespace

TEST_CASE("Roles are resolved from the session", "[engine][participant]")
{
    Session s;
    REQUIRE(s.authority.find(kEnemy)->role() == Role::Authority);
    REQUIRE(s.replica.find(kEnemy)->role() == Role::Replica);
    REQUIRE_FALSE(s.replicaWorld.behavior.enabled);
    REQUIRE(s.authorityWorld.behavior.enabled);
}

TEST_CASE("Replica follows a moving authority", "[engine][participant]")
{
    Session s;
    double angle = 0.0;
    s.authority.setSimulationHook([&](float dt) {
        angle += 0.5 * dt;
        s.authorityWorld.body.current.position =
            Vec3f{3.0f * static_cast<float>(std::cos(angle)), 0.0f, 3.0f * static_cast<float>(std::sin(angle))};
    });
    s.replica.setSimulationHook([&](float) {
        s.replicaWorld.body.current.position.x += 0.5f;
    });

    s.run(600);

    const Vec3f a = s.authorityWorld.body.current.position;
    const Vec3f r = s.replicaWorld.body.current.position;
    REQUIRE(rpl::math::planarDistance(a, r) < 1.0f);
    REQUIRE(s.authority.snapshotsPublished() >= 99);
}

TEST_CASE("Forwarded damage lands exactly once on both sides", "[engine][participant]")
{
    Session s;
    s.run(2);

    auto *onReplica = s.replica.find(kEnemy);
    REQUIRE(onReplica->requestDamage(10.0f, Vec3f{}, Vec3f{0.0f, 0.0f, 1.0f}, 2).has_value());
    s.run(12);

    REQUIRE(s.authority.find(kEnemy)->health() == 90.0f);
    REQUIRE(onReplica->health() == 90.0f);
    REQUIRE(s.authorityWorld.health.value() == 90.0f);
    REQUIRE(s.replicaWorld.health.value() == 90.0f);
}

TEST_CASE("Death propagates once and teardown follows on both sides", "[engine][participant]")
{
    Session s;
    std::vector<EntityId> removedOnReplica;
    s.replica.setTeardownHook([&](EntityId id) { removedOnReplica.push_back(id); });
    s.run(2);

    auto *onReplica = s.replica.find(kEnemy);
    for (int i = 0; i < 10; ++i)
        REQUIRE(onReplica->requestDamage(10.0f, Vec3f{}, Vec3f{}, 2).has_value());
    s.run(12);

    REQUIRE(s.authority.find(kEnemy)->isDead());
    REQUIRE(onReplica->isDead());
    REQUIRE(s.authorityWorld.behavior.deaths == 1);
    REQUIRE(s.replicaWorld.behavior.deaths == 1);

    s.run(60);
    REQUIRE(s.authority.entityCount() == 1);
    REQUIRE(s.replica.entityCount() == 1);

    s.run(3 * 60);
    REQUIRE(s.authority.entityCount() == 0);
    REQUIRE(s.replica.entityCount() == 0);
    REQUIRE(removedOnReplica == std::vector<EntityId>{kEnemy});
    REQUIRE(s.replicaWorld.behavior.deaths == 1);
}

TEST_CASE("Lost snapshots only delay the replica", "[engine][participant]")
{
    Session s;
    int dropped = 0;
    s.hub.setFilter([&](const rpl::net::protocol::Envelope &env, rpl::net::protocol::ParticipantId) {
        if (env.header.kind != rpl::net::protocol::MessageKind::Snapshot)
            return true;
        return (++dropped % 2) == 0;
    });

    s.authority.setSimulationHook([&](float dt) { s.authorityWorld.body.current.position.z += 1.0f * dt; });
    s.run(300);

    const Vec3f a = s.authorityWorld.body.current.position;
    const Vec3f r = s.replicaWorld.body.current.position;
    REQUIRE(rpl::math::planarDistance(a, r) < 1.0f);
    REQUIRE(s.hub.droppedCount() > 0);
}

TEST_CASE("Messages for unknown entities are dropped", "[engine][participant]")
{
    Session s;
    rpl::net::protocol::Bitstream empty;
    REQUIRE(s.authorityEnd->broadcast(rpl::net::protocol::MessageKind::Teardown, 999, empty).has_value());
    s.run(1);
    REQUIRE(s.replica.entityCount() == 1);
}

TEST_CASE("Spawning validates ids", "[engine][participant]")
{
    Session s;
    World other;
    auto dup = s.authority.spawn(kEnemy, Transform{}, other.bindings());
    REQUIRE(dup.error().code() == ErrorCode::kAlreadyExists);

    auto reserved = s.authority.spawn(0, Transform{}, other.bindings());
    REQUIRE(reserved.error().code() == ErrorCode::kInvalidArgument);

    REQUIRE(s.authority.despawn(kEnemy));
    REQUIRE_FALSE(s.authority.despawn(kEnemy));
}

TEST_CASE("A participant without transport runs solo", "[engine][participant]")
{
    World world;
    const Config cfg = Config::Builder{}.build();
    Participant solo{cfg, nullptr};

    auto spawned = solo.spawn(kEnemy, Transform{}, world.bindings());
    REQUIRE(spawned.has_value());
    REQUIRE((*spawned)->role() == Role::Authority);
    REQUIRE(world.behavior.enabled);

    REQUIRE((*spawned)->requestDamage(100.0f, Vec3f{}, Vec3f{}, 0).has_value());
    for (int i = 0; i < 4 * 60; ++i)
        solo.tick(cfg.fixedDeltaTime());

    REQUIRE(solo.entityCount() == 0);
    REQUIRE(solo.snapshotsPublished() == 0);
}

TEST_CASE("Spawning stops at the entity limit", "[engine][participant]")
{
    World world;
    const Config cfg = Config::Builder{}.build();
    Participant solo{cfg, nullptr};

    const auto previous = rpl::core::Log::minLevel();
    rpl::core::Log::setMinLevel(rpl::core::LogLevel::kWarn);
    for (EntityId id = 1; id <= rpl::core::kMaxEntities; ++id)
        REQUIRE(solo.spawn(id, Transform{}, world.bindings()).has_value());
    rpl::core::Log::setMinLevel(previous);

    REQUIRE(solo.entityCount() == rpl::core::kMaxEntities);
    auto extra = solo.spawn(rpl::core::kMaxEntities + 1, Transform{}, world.bindings());
    REQUIRE_FALSE(extra.has_value());
    REQUIRE(extra.error().code() == ErrorCode::kOutOfRange);

    REQUIRE(solo.despawn(1));
    REQUIRE(solo.spawn(rpl::core::kMaxEntities + 1, Transform{}, world.bindings()).has_value());
}
