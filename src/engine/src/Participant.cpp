// /////////////////////////////////////////////////////////////////////////////
/// @file Participant.cpp
/// @brief Participant façade implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rpl/engine/Participant.hpp>

#include <rpl/net/session/RoleResolver.hpp>

#include <rpl/core/Assert.hpp>
#include <rpl/core/Constants.hpp>
#include <rpl/core/Log.hpp>

#include <map>
#include <string>
#include <vector>

namespace rpl::engine {

using replication::EntityId;
using replication::ReplicatedEntity;

struct Participant::Impl
{
    Config                                            config;
    net::transport::ITransport                       *transport;
    concurrency::DeferredScheduler                    scheduler;
    std::map<EntityId, std::unique_ptr<ReplicatedEntity>> entities;

    SimulationHook simulationHook;
    TeardownHook   teardownHook;

    core::u64 tick{0};
    core::f64 elapsed{0.0};
    core::f64 sendAccumulator{0.0};
    core::u64 dispatched{0};
    core::u64 published{0};

    Impl(const Config &cfg, net::transport::ITransport *t)
        : config{cfg}
        , transport{t}
    {
    }

    void dispatch(const net::protocol::Envelope &envelope)
    {
        const EntityId id = envelope.header.entity;
        auto it = entities.find(id);
        if (it == entities.end())
        {
            const auto error = core::makeError(core::ErrorCode::kNotFound,
                                               "Participant: " + std::string{net::protocol::toString(envelope.header.kind)} +
                                                   " for unknown entity " + std::to_string(id));
            core::Log::warn("NET", error.error().describe());
            return;
        }

        ++dispatched;
        auto result = it->second->onMessage(envelope);
        if (!result)
            core::Log::warn("NET", result.error().describe());
    }

    void publishSnapshots()
    {
        for (auto &[id, entity] : entities)
        {
            if (!entity->isAuthority() || !entity->isActive() || entity->isSolo())
                continue;
            auto sent = entity->publishSnapshot();
            if (!sent)
            {
                core::Log::warn("NET", "Participant: snapshot of entity " + std::to_string(id) +
                                           " not sent: " + sent.error().describe());
                continue;
            }
            ++published;
        }
    }

    void reapTornDown()
    {
        std::vector<EntityId> doomed;
        for (const auto &[id, entity] : entities)
        {
            if (entity->teardownRequested())
                doomed.push_back(id);
        }
        for (EntityId id : doomed)
        {
            if (teardownHook)
                teardownHook(id);
            entities.erase(id);
            core::Log::info("REPL", "Participant: entity " + std::to_string(id) + " removed");
        }
    }
};

Participant::Participant(const Config &config, net::transport::ITransport *transport)
    : _impl{std::make_unique<Impl>(config, transport)}
{
    RPL_ASSERT(config.validate().has_value());
    core::Log::info("REPL", "Participant: created on " +
                                std::string{transport ? transport->name() : "no transport"});
}

Participant::~Participant() = default;

core::Expected<ReplicatedEntity *> Participant::spawn(EntityId id, const replication::Transform &initial,
                                                      replication::EntityBindings bindings)
{
    if (id == net::protocol::kInvalidEntity)
        return core::makeError(core::ErrorCode::kInvalidArgument, "Participant: entity id 0 is reserved");
    if (_impl->entities.contains(id))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "Participant: entity " + std::to_string(id) + " already spawned");
    }
    if (_impl->entities.size() >= core::kMaxEntities)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "Participant: entity limit of " + std::to_string(core::kMaxEntities) +
                                   " reached");
    }

    const net::session::SessionInfo info =
        _impl->transport ? _impl->transport->sessionInfo() : net::session::SessionInfo{};
    const bool solo = net::session::RoleResolver::isSolo(info);
    const auto role = net::session::RoleResolver::resolve(info);

    core::Log::info("REPL", "Participant: entity " + std::to_string(id) + " resolved as " +
                                std::string{net::session::toString(role)} + (solo ? " (solo)" : ""));

    replication::EntityContext context{solo ? nullptr : _impl->transport, _impl->scheduler,
                                       _impl->config.replication()};
    auto entity = std::make_unique<ReplicatedEntity>(id, initial, role, std::move(context), bindings);
    entity->activate();

    auto *raw = entity.get();
    _impl->entities.emplace(id, std::move(entity));
    return raw;
}

bool Participant::despawn(EntityId id)
{
    return _impl->entities.erase(id) > 0;
}

ReplicatedEntity *Participant::find(EntityId id) noexcept
{
    auto it = _impl->entities.find(id);
    return it == _impl->entities.end() ? nullptr : it->second.get();
}

void Participant::setSimulationHook(SimulationHook hook)
{
    _impl->simulationHook = std::move(hook);
}

void Participant::setTeardownHook(TeardownHook hook)
{
    _impl->teardownHook = std::move(hook);
}

void Participant::tick(core::f64 dt)
{
    auto &impl = *_impl;
    const auto fdt = static_cast<core::f32>(dt);

    ++impl.tick;
    impl.elapsed += dt;
    impl.scheduler.advance(impl.tick, impl.elapsed);

    if (impl.transport)
    {
        auto polled = impl.transport->poll([&impl](const net::protocol::Envelope &envelope) {
            impl.dispatch(envelope);
        });
        if (!polled)
            core::Log::warn("NET", "Participant: poll failed: " + polled.error().describe());
    }

    for (auto &[id, entity] : impl.entities)
        entity->enforcePrePhysics();

    if (impl.simulationHook)
        impl.simulationHook(fdt);

    for (auto &[id, entity] : impl.entities)
        entity->reconcile(fdt);

    for (auto &[id, entity] : impl.entities)
        entity->enforcePostCallbacks();

    impl.sendAccumulator += dt;
    const core::f64 interval = impl.config.sendInterval();
    if (impl.sendAccumulator + 1e-9 >= interval)
    {
        impl.sendAccumulator -= interval;
        impl.publishSnapshots();
    }

    impl.reapTornDown();
}

concurrency::DeferredScheduler &Participant::scheduler() noexcept { return _impl->scheduler; }
const Config &Participant::config() const noexcept { return _impl->config; }
core::u64 Participant::tickCount() const noexcept { return _impl->tick; }
core::f64 Participant::elapsed() const noexcept { return _impl->elapsed; }
core::usize Participant::entityCount() const noexcept { return _impl->entities.size(); }
core::u64 Participant::messagesDispatched() const noexcept { return _impl->dispatched; }
core::u64 Participant::snapshotsPublished() const noexcept { return _impl->published; }

} // namespace rpl::engine
