// /////////////////////////////////////////////////////////////////////////////
/// @file Participant.hpp
/// @brief One participant's replicated world (Façade pattern).
///
/// Owns the replicated entities of one game instance, routes inbound
/// messages to them and runs the per-tick order:
///   scheduler → inbound messages → guard (pre-physics) → host simulation
///   → reconciliation → guard (post-callbacks) → snapshots → reaping.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rpl/engine/Config.hpp>

#include <rpl/replication/ReplicatedEntity.hpp>

#include <rpl/concurrency/DeferredScheduler.hpp>
#include <rpl/net/transport/ITransport.hpp>

#include <rpl/core/Expected.hpp>
#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <functional>
#include <memory>

namespace rpl::engine {

/// @brief Replication front-end of one participant.
class Participant final : public core::NonCopyable<Participant>
{
public:
    /// @brief Host physics, behavior and local movers for one tick.
    using SimulationHook = std::function<void(core::f32 dt)>;

    /// @brief Called right before a torn-down entity is removed.
    using TeardownHook = std::function<void(replication::EntityId)>;

    /// @param config    Validated configuration; checked by RPL_ASSERT in debug builds.
    /// @param transport Null for an offline (solo) participant.
    Participant(const Config &config, net::transport::ITransport *transport);
    ~Participant();

    /// @brief Creates and activates an entity.  The role is resolved here,
    ///        once, from the current session state.
    /// @return kOutOfRange once kMaxEntities entities are live.
    [[nodiscard]] core::Expected<replication::ReplicatedEntity *> spawn(
        replication::EntityId id,
        const replication::Transform &initial,
        replication::EntityBindings bindings);

    /// @brief Removes an entity without any network traffic.
    bool despawn(replication::EntityId id);

    [[nodiscard]] replication::ReplicatedEntity *find(replication::EntityId id) noexcept;

    void setSimulationHook(SimulationHook hook);
    void setTeardownHook(TeardownHook hook);

    /// @brief Runs one fixed step.
    void tick(core::f64 dt);

    [[nodiscard]] concurrency::DeferredScheduler &scheduler() noexcept;
    [[nodiscard]] const Config &config() const noexcept;
    [[nodiscard]] core::u64     tickCount() const noexcept;
    [[nodiscard]] core::f64     elapsed() const noexcept;
    [[nodiscard]] core::usize   entityCount() const noexcept;
    [[nodiscard]] core::u64     messagesDispatched() const noexcept;
    [[nodiscard]] core::u64     snapshotsPublished() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rpl::engine
