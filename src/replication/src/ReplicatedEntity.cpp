/**
 * @file ReplicatedEntity.cpp
 * @brief ReplicatedEntity implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/ReplicatedEntity.hpp>

#include <rpl/replication/CommandForwarder.hpp>
#include <rpl/replication/DeathEdgeDispatcher.hpp>
#include <rpl/replication/SnapshotChannel.hpp>

#include <rpl/core/Log.hpp>

#include <string>

namespace rpl::replication {

namespace {

std::string entityTag(EntityId id)
{
    return "ReplicatedEntity " + std::to_string(id) + ": ";
}

} // namespace

// /////////////////////////////////////////////////////////////////////////////
//  Impl
// /////////////////////////////////////////////////////////////////////////////

struct ReplicatedEntity::Impl
{
    const EntityId                   id;
    const Role                       role;
    const Transform                  initial;
    EntityContext                    context;
    EntityBindings                   bindings;

    GroundTruthState                 state;
    ObservedStream                   stream;
    SnapshotChannel                  channel;
    ReconciliationEngine             reconciliation;
    AuthorityGuard                   guard;
    DeathEdgeDispatcher              deathEdge;
    std::unique_ptr<MutationApplier> applier;
    CommandForwarder                 forwarder;
    RecheckSchedule                  recheck;

    concurrency::TaskId              secondPass{concurrency::kInvalidTask};
    concurrency::TaskId              teardownTask{concurrency::kInvalidTask};
    bool                             active{false};
    bool                             tornDown{false};
    bool                             firstSnapshotSeen{false};

    Impl(EntityId id_, const Transform &initial_, Role role_, EntityContext context_, EntityBindings bindings_)
        : id{id_}
        , role{role_}
        , initial{initial_}
        , context{std::move(context_)}
        , bindings{bindings_}
        , channel{id_, stream}
        , reconciliation{context.settings}
        , guard{bindings.body, reconciliation.presentation()}
        , deathEdge{[this] { onReplicaDeathEdge(); }}
        , applier{role_ == Role::Authority
                      ? std::make_unique<MutationApplier>(state, bindings.health, [this] { onAuthorityDeath(); })
                      : nullptr}
        , forwarder{id_, role_, context.transport, applier.get()}
        , recheck{context.scheduler, context.settings.recheckOffsets, [this] { return recheckInvariants(); },
                  "entity " + std::to_string(id_) + " re-check"}
    {
        if (role == Role::Authority)
            channel.bindSource([this] { return Snapshot::capture(state); });
        else
            channel.bindSink([this](const Snapshot &s) { applySnapshot(s); });
    }

    // --------------------------------------------------------------------- //
    //  Suppression passes                                                    //
    // --------------------------------------------------------------------- //

    core::u32 suppressLocalSimulation()
    {
        if (bindings.behavior)
            bindings.behavior->setSimulationEnabled(false);
        bindings.body.freezeSimulation();
        return bindings.movers ? bindings.movers->suspendAll() : 0;
    }

    core::u32 exclusivityPass(const char *label)
    {
        core::u32 fixed = channel.enforceExclusivity();
        if (role == Role::Replica && bindings.movers)
            fixed += bindings.movers->suspendAll();
        if (fixed > 0)
        {
            core::Log::info("REPL", entityTag(id) + label + " repaired " + std::to_string(fixed) + " violation(s)");
        }
        return fixed;
    }

    core::u32 recheckInvariants()
    {
        core::u32 fixed = channel.enforceExclusivity();
        if (role == Role::Replica && bindings.movers)
            fixed += bindings.movers->suspendAll();
        return fixed;
    }

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    void activate(const Transform &spawn)
    {
        cancelDeferred();

        state             = GroundTruthState{spawn.position, spawn.rotation, context.settings.maxHealth, false};
        tornDown          = false;
        firstSnapshotSeen = false;
        deathEdge.reset();
        reconciliation.reset();
        if (bindings.health)
            bindings.health->resetToMax();

        if (role == Role::Replica)
            suppressLocalSimulation();
        else if (bindings.behavior)
            bindings.behavior->setSimulationEnabled(true);

        bindings.body.setTransform(spawn);

        exclusivityPass("first pass");
        secondPass = context.scheduler.scheduleAfterTicks(
            context.settings.secondPassTickDelay,
            [this] {
                secondPass = concurrency::kInvalidTask;
                exclusivityPass("second pass");
            },
            "entity " + std::to_string(id) + " second pass");
        recheck.start();

        active = true;
        core::Log::info("REPL", entityTag(id) + "activated as " + std::string{net::session::toString(role)} +
                                    (context.transport ? "" : " (solo)"));
    }

    void cancelDeferred()
    {
        if (secondPass != concurrency::kInvalidTask)
            context.scheduler.cancel(secondPass);
        if (teardownTask != concurrency::kInvalidTask)
            context.scheduler.cancel(teardownTask);
        secondPass   = concurrency::kInvalidTask;
        teardownTask = concurrency::kInvalidTask;
        recheck.cancel();
    }

    void deactivate()
    {
        cancelDeferred();
        if (active)
            core::Log::debug("REPL", entityTag(id) + "deactivated");
        active = false;
    }

    // --------------------------------------------------------------------- //
    //  Death and teardown                                                    //
    // --------------------------------------------------------------------- //

    void onAuthorityDeath()
    {
        core::Log::info("REPL", entityTag(id) + "died on authority, teardown in " +
                                    std::to_string(context.settings.teardownDelay) + " s");
        if (bindings.behavior)
            bindings.behavior->notifyDeath();

        teardownTask = context.scheduler.scheduleAfterSeconds(
            context.settings.teardownDelay,
            [this] {
                teardownTask = concurrency::kInvalidTask;
                performTeardown();
            },
            "entity " + std::to_string(id) + " teardown");
    }

    void performTeardown()
    {
        if (context.transport)
        {
            syncFromBody();
            net::protocol::Bitstream last;
            stream.serialize(last);
            auto sent = context.transport->broadcast(net::protocol::MessageKind::Snapshot, id, last);
            if (sent)
            {
                net::protocol::Bitstream empty;
                sent = context.transport->broadcast(net::protocol::MessageKind::Teardown, id, empty);
            }
            if (!sent)
                core::Log::warn("NET", entityTag(id) + "teardown broadcast failed: " + sent.error().describe());
        }
        tornDown = true;
        core::Log::info("REPL", entityTag(id) + "torn down");
        deactivate();
    }

    void onReplicaDeathEdge()
    {
        core::Log::info("REPL", entityTag(id) + "death edge received");
        if (bindings.behavior)
            bindings.behavior->notifyDeath();
    }

    // --------------------------------------------------------------------- //
    //  Replication                                                           //
    // --------------------------------------------------------------------- //

    void syncFromBody()
    {
        const Transform t = bindings.body.transform();
        state.position    = t.position;
        state.rotation    = t.rotation;
    }

    void applySnapshot(const Snapshot &s)
    {
        if (!firstSnapshotSeen)
        {
            firstSnapshotSeen = true;
            core::Log::info("REPL", entityTag(id) + "first snapshot received (health " +
                                        std::to_string(s.health) + (s.isDead ? ", dead)" : ")"));
        }

        const bool wasDead = state.isDead;
        state.position     = s.position;
        state.rotation     = s.rotation;
        if (wasDead && !s.isDead)
        {
            core::Log::debug("REPL", entityTag(id) + "alive snapshot after death, health kept");
        }
        else
        {
            state.health = s.health;
            state.isDead = s.isDead;
            if (bindings.health)
                bindings.health->setValue(s.health);
        }

        reconciliation.onSnapshot(s);
        deathEdge.onSnapshotApplied(wasDead, state.isDead);
    }
};

// /////////////////////////////////////////////////////////////////////////////
//  ReplicatedEntity
// /////////////////////////////////////////////////////////////////////////////

ReplicatedEntity::ReplicatedEntity(EntityId id, const Transform &initial, Role role,
                                   EntityContext context, EntityBindings bindings)
    : _impl{std::make_unique<Impl>(id, initial, role, std::move(context), bindings)}
{}

ReplicatedEntity::~ReplicatedEntity()
{
    _impl->deactivate();
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void ReplicatedEntity::activate() { _impl->activate(_impl->initial); }
void ReplicatedEntity::activate(const Transform &spawn) { _impl->activate(spawn); }
void ReplicatedEntity::deactivate() { _impl->deactivate(); }

// -------------------------------------------------------------------------- //
//  Tick hooks                                                                //
// -------------------------------------------------------------------------- //

void ReplicatedEntity::enforcePrePhysics()
{
    if (_impl->active && _impl->role == Role::Replica)
        _impl->guard.enforce(GuardPhase::PrePhysics);
}

void ReplicatedEntity::reconcile(core::f32 dt)
{
    if (!_impl->active)
        return;

    if (_impl->role == Role::Authority)
    {
        _impl->syncFromBody();
        return;
    }

    if (auto next = _impl->reconciliation.update(_impl->bindings.body.transform(), dt))
        _impl->bindings.body.setTransform(*next);
}

void ReplicatedEntity::enforcePostCallbacks()
{
    if (_impl->active && _impl->role == Role::Replica)
        _impl->guard.enforce(GuardPhase::PostCallbacks);
}

core::Expected<void> ReplicatedEntity::publishSnapshot()
{
    if (_impl->role != Role::Authority)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "ReplicatedEntity: replicas never publish");
    }
    if (!_impl->active || !_impl->context.transport)
        return {};

    _impl->syncFromBody();
    net::protocol::Bitstream payload;
    _impl->stream.serialize(payload);
    return _impl->context.transport->broadcast(net::protocol::MessageKind::Snapshot, _impl->id, payload);
}

// -------------------------------------------------------------------------- //
//  Inbound messages                                                          //
// -------------------------------------------------------------------------- //

core::Expected<void> ReplicatedEntity::onMessage(const net::protocol::Envelope &envelope)
{
    using net::protocol::MessageKind;

    switch (envelope.header.kind)
    {
    case MessageKind::Snapshot:
    {
        if (_impl->role == Role::Authority)
        {
            return core::makeError(core::ErrorCode::kProtocolViolation,
                                   entityTag(_impl->id) + "snapshot received by the authority");
        }
        if (!_impl->active)
            return {};
        auto payload = envelope.payloadStream();
        return _impl->stream.deserialize(payload);
    }

    case MessageKind::CommandRequest:
    {
        if (!_impl->active)
            return {};
        auto payload = envelope.payloadStream();
        auto result  = _impl->forwarder.onCommandReceived(payload, envelope.header.sender);
        if (!result)
            return std::unexpected(result.error());
        core::Log::debug("REPL", entityTag(_impl->id) + "command from participant " +
                                     std::to_string(envelope.header.sender) + ": " +
                                     std::string{toString(*result)});
        return {};
    }

    case MessageKind::Teardown:
    {
        if (_impl->role == Role::Authority)
        {
            return core::makeError(core::ErrorCode::kProtocolViolation,
                                   entityTag(_impl->id) + "teardown received by the authority");
        }
        _impl->tornDown = true;
        core::Log::info("REPL", entityTag(_impl->id) + "torn down by authority");
        _impl->deactivate();
        return {};
    }
    }

    return core::makeError(core::ErrorCode::kProtocolViolation, entityTag(_impl->id) + "unknown message kind");
}

// -------------------------------------------------------------------------- //
//  Requests                                                                  //
// -------------------------------------------------------------------------- //

core::Expected<void> ReplicatedEntity::requestDamage(core::f32 amount, Vec3f position,
                                                     Vec3f direction, AttackerId attacker)
{
    if (!_impl->active)
        return core::makeError(core::ErrorCode::kInvalidState, entityTag(_impl->id) + "inactive");

    if (isDead())
    {
        core::Log::debug("REPL", entityTag(_impl->id) + "damage request on dead entity dropped");
        return {};
    }
    return _impl->forwarder.requestMutation(amount, position, direction, attacker);
}

// -------------------------------------------------------------------------- //
//  Queries                                                                   //
// -------------------------------------------------------------------------- //

EntityId ReplicatedEntity::id() const noexcept { return _impl->id; }
Role ReplicatedEntity::role() const noexcept { return _impl->role; }
bool ReplicatedEntity::isAuthority() const noexcept { return _impl->role == Role::Authority; }
bool ReplicatedEntity::isActive() const noexcept { return _impl->active; }
bool ReplicatedEntity::isSolo() const noexcept { return _impl->context.transport == nullptr; }
bool ReplicatedEntity::isDead() const noexcept { return _impl->state.isDead; }
core::f32 ReplicatedEntity::health() const noexcept { return _impl->state.health; }
bool ReplicatedEntity::teardownRequested() const noexcept { return _impl->tornDown; }

const GroundTruthState &ReplicatedEntity::groundTruth() const noexcept { return _impl->state; }

const PresentationState &ReplicatedEntity::presentation() const noexcept
{
    return _impl->reconciliation.presentation();
}

ObservedStream &ReplicatedEntity::stream() noexcept { return _impl->stream; }
const AuthorityGuard &ReplicatedEntity::guard() const noexcept { return _impl->guard; }
const RecheckSchedule &ReplicatedEntity::rechecks() const noexcept { return _impl->recheck; }
const MutationApplier *ReplicatedEntity::applier() const noexcept { return _impl->applier.get(); }
bool ReplicatedEntity::isChannelExclusive() const noexcept { return _impl->channel.isExclusive(); }

} // namespace rpl::replication
