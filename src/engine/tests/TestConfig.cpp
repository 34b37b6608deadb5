/**
 * @file TestConfig.cpp
 * @brief Unit tests for the participant configuration builder.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <rpl/engine/Config.hpp>

using rpl::core::ErrorCode;
using rpl::engine::Config;

TEST_CASE("Defaults are valid and match the documented values", "[engine][config]")
{
    const Config cfg = Config::Builder{}.build();

    REQUIRE(cfg.validate().has_value());
    REQUIRE(cfg.tickRate() == 60);
    REQUIRE(cfg.sendRate() == 10);
    REQUIRE(cfg.snapDistance() == 5.0f);
    REQUIRE(cfg.maxHealth() == 100.0f);
    REQUIRE(cfg.teardownDelay() == 3.0);
    REQUIRE(cfg.secondPassTickDelay() == 1);
    REQUIRE(cfg.recheckOffsets() == std::vector<double>{0.5, 1.5, 3.0});
}

TEST_CASE("Builder values flow into the replication settings", "[engine][config]")
{
    const Config cfg = Config::Builder{}
                           .positionLerpRate(4.0f)
                           .rotationLerpRate(6.0f)
                           .snapDistance(2.5f)
                           .maxHealth(250.0f)
                           .teardownDelay(1.0)
                           .secondPassTickDelay(2)
                           .recheckOffsets({0.25, 1.0})
                           .build();

    const auto settings = cfg.replication();
    REQUIRE(settings.positionLerpRate == 4.0f);
    REQUIRE(settings.rotationLerpRate == 6.0f);
    REQUIRE(settings.snapDistance == 2.5f);
    REQUIRE(settings.maxHealth == 250.0f);
    REQUIRE(settings.teardownDelay == 1.0);
    REQUIRE(settings.secondPassTickDelay == 2);
    REQUIRE(settings.recheckOffsets == std::vector<double>{0.25, 1.0});
}

TEST_CASE("Validation rejects unusable values", "[engine][config]")
{
    auto rejected = [](const Config &cfg) {
        auto r = cfg.validate();
        return !r && r.error().code() == ErrorCode::kInvalidArgument;
    };

    REQUIRE(rejected(Config::Builder{}.tickRate(0).build()));
    REQUIRE(rejected(Config::Builder{}.sendRate(0).build()));
    REQUIRE(rejected(Config::Builder{}.tickRate(30).sendRate(60).build()));
    REQUIRE(rejected(Config::Builder{}.positionLerpRate(0.0f).build()));
    REQUIRE(rejected(Config::Builder{}.maxHealth(-1.0f).build()));
    REQUIRE(rejected(Config::Builder{}.snapDistance(-0.1f).build()));
    REQUIRE(rejected(Config::Builder{}.recheckOffsets({1.5, 0.5}).build()));
}

TEST_CASE("Rates convert to intervals", "[engine][config]")
{
    const Config cfg = Config::Builder{}.tickRate(50).sendRate(5).build();
    REQUIRE(cfg.fixedDeltaTime() == 1.0 / 50.0);
    REQUIRE(cfg.sendInterval() == 1.0 / 5.0);
}
