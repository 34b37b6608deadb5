/**
 * @file TestAuthorityGuard.cpp
 * @brief Unit tests for the authority guard.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/replication/AuthorityGuard.hpp>
#include <rpl/replication/ReconciliationEngine.hpp>

#include "Fakes.hpp"

using namespace rpl::replication;
using namespace rpl::replication::test;

TEST_CASE("Guard is inert until reconciliation arms it", "[replication][guard]")
{
    ReplicationSettings settings;
    ReconciliationEngine engine{settings};
    FakeBody body;
    body.current.position = Vec3f{9.0f, 9.0f, 9.0f};
    AuthorityGuard guard{body, engine.presentation()};

    REQUIRE_FALSE(guard.enforce(GuardPhase::PrePhysics));
    REQUIRE(body.current.position == Vec3f{9.0f, 9.0f, 9.0f});
    REQUIRE(guard.enforcements() == 0);
}

TEST_CASE("Foreign writes between the two phases are undone", "[replication][guard]")
{
    ReplicationSettings settings;
    ReconciliationEngine engine{settings};
    FakeBody body;
    AuthorityGuard guard{body, engine.presentation()};

    engine.onSnapshot(Snapshot{Vec3f{5.0f, 1.0f, 5.0f}, Quatf::identity(), 100.0f, false});
    body.setTransform(*engine.update(body.transform(), 0.016f));
    const Vec3f good = engine.presentation().lastGoodPosition;

    for (int tick = 0; tick < 5; ++tick)
    {
        guard.enforce(GuardPhase::PrePhysics);
        body.current.position.x += 0.5f;      // root motion
        body.current.position.y -= 9.81f;     // gravity integrator
        REQUIRE(guard.enforce(GuardPhase::PostCallbacks));
        REQUIRE(body.current.position == good);
    }

    REQUIRE(guard.corrections(GuardPhase::PostCallbacks) == 5);
    REQUIRE(guard.corrections(GuardPhase::PrePhysics) == 0);
    REQUIRE(guard.enforcements() == 10);
}

TEST_CASE("Guard leaves rotation to the body", "[replication][guard]")
{
    ReplicationSettings settings;
    ReconciliationEngine engine{settings};
    FakeBody body;
    AuthorityGuard guard{body, engine.presentation()};
    (void)engine.reconcile(Transform{}, Snapshot{Vec3f{}, Quatf::identity(), 100.0f, false}, 0.016f);

    const auto turned = Quatf::fromAxisAngle(Vec3f::unitY(), 0.3f);
    body.current.rotation = turned;
    guard.enforce(GuardPhase::PostCallbacks);
    REQUIRE(body.current.rotation.angleTo(turned) < 1e-5f);
}
