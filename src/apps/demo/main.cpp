// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief ReplicaCore demo entry-point.
///
/// Two participants in one process share one hostile entity over the
/// loopback transport.  The authority runs a chase-in-a-circle behavior,
/// the replica hosts a navigation agent that keeps switching itself back
/// on and periodically forwards damage.  Exits once the entity has been
/// torn down on both participants.
///
/// Usage: rpl_demo [--fast] [--debug]
// /////////////////////////////////////////////////////////////////////////////

#include <rpl/engine/Config.hpp>
#include <rpl/engine/Participant.hpp>
#include <rpl/engine/TickLoop.hpp>

#include <rpl/net/transport/LoopbackTransport.hpp>

#include <rpl/core/Log.hpp>
#include <rpl/core/Types.hpp>

#include <cmath>
#include <string>
#include <string_view>

using namespace rpl;

namespace {

using replication::Quatf;
using replication::Transform;
using replication::Vec3f;

constexpr replication::EntityId kEnemyId = 1;

/// @brief Rigid body of the demo: a plain transform.
class DemoBody final : public replication::IReplicatedBody
{
public:
    Transform transform() const override { return _transform; }
    void setTransform(const Transform &transform) override { _transform = transform; }
    void freezeSimulation() override { _frozen = true; }

    [[nodiscard]] bool frozen() const noexcept { return _frozen; }

private:
    Transform _transform{};
    bool      _frozen{false};
};

/// @brief Runs in a circle around the origin while enabled.
class ChaseBehavior final : public replication::IBehaviorController
{
public:
    explicit ChaseBehavior(DemoBody &body) : _body{body} {}

    void setSimulationEnabled(bool enabled) override { _enabled = enabled; }
    void notifyDeath() override
    {
        _enabled = false;
        core::Log::info("DEMO", "ChaseBehavior: playing death animation");
    }

    void step(core::f32 dt)
    {
        if (!_enabled)
            return;
        _angle += 0.8f * dt;
        const Vec3f position{4.0f * std::cos(_angle), 0.0f, 4.0f * std::sin(_angle)};
        _body.setTransform(Transform{position, Quatf::fromAxisAngle(Vec3f{0.0f, 1.0f, 0.0f}, -_angle)});
    }

private:
    DemoBody &_body;
    bool      _enabled{true};
    core::f32 _angle{0.0f};
};

/// @brief Navigation agent that re-enables itself some time after suspension.
class StubbornNavAgent final : public replication::ILocalMover
{
public:
    explicit StubbornNavAgent(DemoBody &body) : _body{body} {}

    std::string_view name() const noexcept override { return "StubbornNavAgent"; }
    bool active() const noexcept override { return _active; }
    void suspend() override
    {
        _active    = false;
        _idleTicks = 0;
    }

    void step()
    {
        if (!_active)
        {
            if (++_idleTicks == 45)
                _active = true;
            return;
        }
        auto t = _body.transform();
        t.position.x += 0.25f;
        _body.setTransform(t);
    }

private:
    DemoBody &_body;
    bool      _active{true};
    core::u32 _idleTicks{0};
};

struct Host
{
    DemoBody                     body;
    ChaseBehavior                behavior{body};
    replication::HealthAttribute health;
    replication::MoverRegistry   movers;
    StubbornNavAgent             nav{body};

    explicit Host(core::f32 maxHealth) : health{maxHealth} { movers.add(nav); }

    replication::EntityBindings bindings()
    {
        return replication::EntityBindings{body, &behavior, &health, &movers};
    }
};

} // namespace

int main(int argc, char *argv[])
{
    bool fast  = false;
    bool debug = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--fast")
            fast = true;
        else if (arg == "--debug")
            debug = true;
        else
        {
            core::Log::error("DEMO", "unknown argument '" + std::string{arg} + "'");
            return 2;
        }
    }

    const auto config = engine::Config::Builder{}
        .tickRate(60)
        .sendRate(10)
        .logLevel(debug ? core::LogLevel::kDebug : core::LogLevel::kInfo)
        .build();

    if (auto valid = config.validate(); !valid)
    {
        core::Log::fatal("DEMO", valid.error().describe());
        return 1;
    }
    core::Log::setMinLevel(config.logLevel());
    core::Log::info("DEMO", "=== ReplicaCore demo ===");

    net::transport::LoopbackHub hub;
    auto authorityEnd = hub.connect(1);
    auto replicaEnd   = hub.connect(2);
    hub.setAuthority(1);

    Host authorityHost{config.maxHealth()};
    Host replicaHost{config.maxHealth()};

    engine::Participant authority{config, authorityEnd.get()};
    engine::Participant replica{config, replicaEnd.get()};

    const Transform spawn{Vec3f{4.0f, 0.0f, 0.0f}, Quatf::identity()};
    auto onAuthority = authority.spawn(kEnemyId, spawn, authorityHost.bindings());
    auto onReplica   = replica.spawn(kEnemyId, spawn, replicaHost.bindings());
    if (!onAuthority || !onReplica)
    {
        core::Log::fatal("DEMO", "spawn failed: " +
                                     (onAuthority ? onReplica.error() : onAuthority.error()).describe());
        return 1;
    }

    authority.setSimulationHook([&](core::f32 dt) { authorityHost.behavior.step(dt); });
    replica.setSimulationHook([&](core::f32 dt) {
        replicaHost.behavior.step(dt);
        replicaHost.nav.step();
    });

    bool goneOnAuthority = false;
    bool goneOnReplica   = false;
    authority.setTeardownHook([&](replication::EntityId) { goneOnAuthority = true; });
    replica.setTeardownHook([&](replication::EntityId) { goneOnReplica = true; });

    engine::TickLoop loop{config};
    engine::LoopCallbacks callbacks;

    callbacks.fixedUpdate = [&](core::f64 dt) {
        authority.tick(dt);
        replica.tick(dt);

        const core::u64 tick = authority.tickCount();
        if (auto *entity = replica.find(kEnemyId); entity && tick % 30 == 0)
        {
            auto sent = entity->requestDamage(10.0f, entity->groundTruth().position,
                                              Vec3f{0.0f, 0.0f, 1.0f}, 2);
            if (!sent)
                core::Log::warn("DEMO", "damage request failed: " + sent.error().describe());
        }

        if (tick % 60 == 0)
        {
            if (const auto *a = authority.find(kEnemyId), *r = replica.find(kEnemyId); a && r)
            {
                const auto drift = math::planarDistance(a->groundTruth().position, r->presentation().currentPosition);
                core::Log::info("DEMO", "t=" + std::to_string(tick / 60) + "s health " +
                                            std::to_string(a->health()) + "/" + std::to_string(r->health()) +
                                            " replica lag " + std::to_string(drift) + " m");
            }
        }
    };

    callbacks.postFrame = [&] {
        if (goneOnAuthority && goneOnReplica)
            loop.requestStop();
    };

    if (fast)
        loop.runTicks(60 * 60, callbacks);
    else
        loop.run(callbacks);

    if (!goneOnAuthority || !goneOnReplica)
    {
        core::Log::error("DEMO", "entity still alive after " + std::to_string(loop.tickCount()) + " ticks");
        return 1;
    }

    core::Log::info("DEMO", "entity torn down on both participants after " + std::to_string(loop.tickCount()) +
                                " ticks, " + std::to_string(hub.droppedCount()) + " messages dropped");
    return 0;
}
