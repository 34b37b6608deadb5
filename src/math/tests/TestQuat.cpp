/**
 * @file TestQuat.cpp
 * @brief Unit tests for Vec3 helpers and quaternion interpolation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <rpl/math/Quat.hpp>

#include <numbers>

using namespace rpl::math;
using Catch::Matchers::WithinAbs;

TEST_CASE("planarDistance ignores the vertical axis", "[math][vec3]")
{
    const Vec3f a{0.0f, 0.0f, 0.0f};
    const Vec3f b{3.0f, 50.0f, 4.0f};
    REQUIRE_THAT(planarDistance(a, b), WithinAbs(5.0f, 1e-6f));
    REQUIRE_THAT(b.length(), WithinAbs(std::sqrt(2525.0f), 1e-4f));
}

TEST_CASE("lerp interpolates component-wise", "[math][vec3]")
{
    const Vec3f r = lerp(Vec3f{0.0f, 0.0f, 0.0f}, Vec3f{10.0f, -10.0f, 4.0f}, 0.25f);
    REQUIRE_THAT(r.x, WithinAbs(2.5f, 1e-6f));
    REQUIRE_THAT(r.y, WithinAbs(-2.5f, 1e-6f));
    REQUIRE_THAT(r.z, WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("fromAxisAngle rotates a vector", "[math][quat]")
{
    const auto q = Quatf::fromAxisAngle(Vec3f::unitY(), std::numbers::pi_v<float> * 0.5f);
    const Vec3f r = q.rotate(Vec3f::unitX());
    REQUIRE_THAT(r.x, WithinAbs(0.0f, 1e-5f));
    REQUIRE_THAT(r.z, WithinAbs(-1.0f, 1e-5f));
}

TEST_CASE("slerp endpoints and midpoint", "[math][quat]")
{
    const auto a = Quatf::identity();
    const auto b = Quatf::fromAxisAngle(Vec3f::unitY(), std::numbers::pi_v<float> * 0.5f);

    REQUIRE_THAT(Quatf::slerp(a, b, 0.0f).angleTo(a), WithinAbs(0.0f, 1e-3f));
    REQUIRE_THAT(Quatf::slerp(a, b, 1.0f).angleTo(b), WithinAbs(0.0f, 1e-3f));

    const auto mid = Quatf::slerp(a, b, 0.5f);
    REQUIRE_THAT(mid.angleTo(a), WithinAbs(std::numbers::pi_v<float> * 0.25f, 1e-3f));
}

TEST_CASE("slerp clamps t and takes the shortest arc", "[math][quat]")
{
    const auto a = Quatf::identity();
    const auto b = Quatf::fromAxisAngle(Vec3f::unitY(), 0.2f);
    const Quatf negB{-b.w, -b.x, -b.y, -b.z};

    REQUIRE_THAT(Quatf::slerp(a, b, 7.0f).angleTo(b), WithinAbs(0.0f, 1e-3f));
    REQUIRE_THAT(Quatf::slerp(a, negB, 0.5f).angleTo(a), WithinAbs(0.1f, 1e-3f));
}
