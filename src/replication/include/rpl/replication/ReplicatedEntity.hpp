// /////////////////////////////////////////////////////////////////////////////
/// @file ReplicatedEntity.hpp
/// @brief One hostile entity under replication, on one participant.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/AuthorityGuard.hpp>
#include <rpl/replication/EntityState.hpp>
#include <rpl/replication/HealthAttribute.hpp>
#include <rpl/replication/IBehaviorController.hpp>
#include <rpl/replication/IReplicatedBody.hpp>
#include <rpl/replication/MoverRegistry.hpp>
#include <rpl/replication/MutationApplier.hpp>
#include <rpl/replication/ObservedStream.hpp>
#include <rpl/replication/RecheckSchedule.hpp>
#include <rpl/replication/ReconciliationEngine.hpp>
#include <rpl/replication/ReplicationSettings.hpp>

#include <rpl/concurrency/DeferredScheduler.hpp>
#include <rpl/net/protocol/Envelope.hpp>
#include <rpl/net/session/RoleResolver.hpp>
#include <rpl/net/transport/ITransport.hpp>

#include <rpl/core/Expected.hpp>
#include <rpl/core/NonCopyable.hpp>

#include <memory>

namespace rpl::replication {

using net::session::Role;

/** @brief What an entity needs from the participant hosting it. */
struct EntityContext
{
    /// @brief Null in solo mode: no replication traffic at all.
    net::transport::ITransport     *transport{nullptr};
    concurrency::DeferredScheduler &scheduler;
    ReplicationSettings             settings{};
};

/** @brief Host-world objects the entity drives.  Only body is required. */
struct EntityBindings
{
    IReplicatedBody     &body;
    IBehaviorController *behavior{nullptr};
    HealthAttribute     *health{nullptr};
    MoverRegistry       *movers{nullptr};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ReplicatedEntity
/// @brief Wires the replication components of one entity together.
///
/// The role is fixed at construction.  activate() is called on spawn and on
/// every pooled reuse; deactivate() cancels all deferred work.
///
/// Per-tick hooks, in order: enforcePrePhysics(), host simulation,
/// reconcile(), enforcePostCallbacks(), then publishSnapshot() on network
/// ticks (authority only).
// /////////////////////////////////////////////////////////////////////////////
class ReplicatedEntity final : public core::NonCopyable<ReplicatedEntity>
{
public:
    ReplicatedEntity(EntityId id, const Transform &initial, Role role,
                     EntityContext context, EntityBindings bindings);
    ~ReplicatedEntity();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    void activate();
    void activate(const Transform &spawn);
    void deactivate();

    // --------------------------------------------------------------------- //
    //  Tick hooks                                                            //
    // --------------------------------------------------------------------- //

    void enforcePrePhysics();
    void reconcile(core::f32 dt);
    void enforcePostCallbacks();

    /// @brief Broadcasts the current ground truth (authority, networked).
    [[nodiscard]] core::Expected<void> publishSnapshot();

    // --------------------------------------------------------------------- //
    //  Inbound messages                                                      //
    // --------------------------------------------------------------------- //

    /// @brief Routes a message addressed to this entity.
    [[nodiscard]] core::Expected<void> onMessage(const net::protocol::Envelope &envelope);

    // --------------------------------------------------------------------- //
    //  Requests                                                              //
    // --------------------------------------------------------------------- //

    /// @brief Damage request from any local source; dropped once dead.
    [[nodiscard]] core::Expected<void> requestDamage(core::f32 amount, Vec3f position,
                                                     Vec3f direction, AttackerId attacker);

    // --------------------------------------------------------------------- //
    //  Queries                                                               //
    // --------------------------------------------------------------------- //

    [[nodiscard]] EntityId  id() const noexcept;
    [[nodiscard]] Role      role() const noexcept;
    [[nodiscard]] bool      isAuthority() const noexcept;
    [[nodiscard]] bool      isActive() const noexcept;

    /// @brief True when the entity runs without any replication traffic.
    [[nodiscard]] bool      isSolo() const noexcept;
    [[nodiscard]] bool      isDead() const noexcept;
    [[nodiscard]] core::f32 health() const noexcept;

    /// @brief Set once the network-wide teardown happened.
    [[nodiscard]] bool      teardownRequested() const noexcept;

    /// @brief Authority ground truth; on a replica, the last replicated values.
    [[nodiscard]] const GroundTruthState  &groundTruth() const noexcept;
    [[nodiscard]] const PresentationState &presentation() const noexcept;

    /// @brief Transport-side observer list of this entity's state channel.
    [[nodiscard]] ObservedStream &stream() noexcept;

    [[nodiscard]] const AuthorityGuard   &guard() const noexcept;
    [[nodiscard]] const RecheckSchedule  &rechecks() const noexcept;
    [[nodiscard]] const MutationApplier  *applier() const noexcept;
    [[nodiscard]] bool                    isChannelExclusive() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rpl::replication
