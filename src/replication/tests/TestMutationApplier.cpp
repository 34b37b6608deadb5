/**
 * @file TestMutationApplier.cpp
 * @brief Unit tests for damage application, death derivation and the
 *        local damage interceptor.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/replication/MutationApplier.hpp>

#include <limits>

using namespace rpl::replication;
using rpl::core::ErrorCode;

namespace {

GroundTruthState fullHealth()
{
    return GroundTruthState{Vec3f{}, Quatf::identity(), 100.0f, false};
}

MutationCommand hit(float amount)
{
    return MutationCommand{amount, Vec3f{1.0f, 0.0f, 0.0f}, Vec3f{0.0f, 0.0f, 1.0f}, 2};
}

} // namespace

TEST_CASE("One command of 10 takes 100 to exactly 90", "[replication][mutation]")
{
    auto state = fullHealth();
    HealthAttribute attribute{100.0f};
    int hitReactions = 0;
    attribute.subscribe([&](const DamageEvent &) { ++hitReactions; });

    MutationApplier applier{state, &attribute, {}};
    auto r = applier.apply(hit(10.0f));

    REQUIRE(r.value() == MutationResult::kApplied);
    REQUIRE(state.health == 90.0f);
    REQUIRE(attribute.value() == 90.0f);
    REQUIRE(hitReactions == 1);
    REQUIRE(applier.ignoredEchoCount() == 1);
    REQUIRE(applier.interceptedCount() == 0);
    REQUIRE_FALSE(applier.isSelfMutating());
}

TEST_CASE("Local damage observed on the attribute is applied once", "[replication][mutation]")
{
    auto state = fullHealth();
    HealthAttribute attribute{100.0f};
    int hitReactions = 0;
    float damageSeen = 0.0f;
    attribute.subscribe([&](const DamageEvent &e) {
        ++hitReactions;
        damageSeen += e.amount;
    });
    MutationApplier applier{state, &attribute, {}};

    attribute.damage(25.0f, Vec3f{}, Vec3f{}, 3);

    REQUIRE(state.health == 75.0f);
    REQUIRE(attribute.value() == 75.0f);
    REQUIRE(applier.interceptedCount() == 1);
    REQUIRE(hitReactions == 1);
    REQUIRE(damageSeen == 25.0f);
}

TEST_CASE("A killing local hit notifies listeners once", "[replication][mutation]")
{
    auto state = fullHealth();
    HealthAttribute attribute{100.0f};
    int hitReactions = 0;
    int deaths = 0;
    attribute.subscribe([&](const DamageEvent &) { ++hitReactions; });
    MutationApplier applier{state, &attribute, [&] { ++deaths; }};

    attribute.damage(150.0f, Vec3f{}, Vec3f{}, 3);

    REQUIRE(state.isDead);
    REQUIRE(state.health == 0.0f);
    REQUIRE(attribute.value() == 0.0f);
    REQUIRE(hitReactions == 1);
    REQUIRE(deaths == 1);
}

TEST_CASE("Health floors at zero and death is set exactly once", "[replication][mutation]")
{
    auto state = fullHealth();
    int deaths = 0;
    MutationApplier applier{state, nullptr, [&] { ++deaths; }};

    REQUIRE(applier.apply(hit(60.0f)).value() == MutationResult::kApplied);
    REQUIRE(applier.apply(hit(60.0f)).value() == MutationResult::kKilled);
    REQUIRE(state.health == 0.0f);
    REQUIRE(state.isDead);
    REQUIRE(state.isConsistent());
    REQUIRE(deaths == 1);
}

TEST_CASE("Dead entities reject further mutation", "[replication][mutation]")
{
    auto state = fullHealth();
    HealthAttribute attribute{100.0f};
    int deaths = 0;
    MutationApplier applier{state, &attribute, [&] { ++deaths; }};

    REQUIRE(applier.apply(hit(100.0f)).value() == MutationResult::kKilled);
    REQUIRE(applier.apply(hit(10.0f)).value() == MutationResult::kIgnoredDead);
    attribute.damage(10.0f, Vec3f{}, Vec3f{}, 3);

    REQUIRE(state.health == 0.0f);
    REQUIRE(deaths == 1);
}

TEST_CASE("Zero damage is applied without effect", "[replication][mutation]")
{
    auto state = fullHealth();
    MutationApplier applier{state, nullptr, {}};
    REQUIRE(applier.apply(hit(0.0f)).value() == MutationResult::kApplied);
    REQUIRE(state.health == 100.0f);
}

TEST_CASE("Negative or non-finite amounts are rejected", "[replication][mutation]")
{
    auto state = fullHealth();
    MutationApplier applier{state, nullptr, {}};

    auto negative = applier.apply(hit(-5.0f));
    REQUIRE(negative.error().code() == ErrorCode::kInvalidArgument);

    auto nan = applier.apply(hit(std::numeric_limits<float>::quiet_NaN()));
    REQUIRE(nan.error().code() == ErrorCode::kInvalidArgument);

    REQUIRE(state.health == 100.0f);
}

TEST_CASE("Applier stops listening when destroyed", "[replication][mutation]")
{
    auto state = fullHealth();
    HealthAttribute attribute{100.0f};
    {
        MutationApplier applier{state, &attribute, {}};
    }
    attribute.damage(10.0f, Vec3f{}, Vec3f{}, 1);
    REQUIRE(state.health == 100.0f);
    REQUIRE(attribute.value() == 90.0f);
}
