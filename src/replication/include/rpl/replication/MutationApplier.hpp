// /////////////////////////////////////////////////////////////////////////////
/// @file MutationApplier.hpp
/// @brief Authority-only application of damage to ground truth.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>
#include <rpl/replication/HealthAttribute.hpp>

#include <rpl/core/Expected.hpp>
#include <rpl/core/NonCopyable.hpp>

#include <functional>
#include <string_view>

namespace rpl::replication {

/** @brief One damage request, however it reached the authority. */
struct MutationCommand
{
    core::f32  amount{0.0f};
    Vec3f      position{};
    Vec3f      direction{};
    AttackerId attacker{net::protocol::kNoParticipant};
};

enum class MutationResult : core::u8
{
    kApplied,
    kKilled,
    kIgnoredDead
};

[[nodiscard]] std::string_view toString(MutationResult result) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class MutationApplier
/// @brief The only path that lowers health or sets isDead.
///
/// health -= amount, floored at 0; isDead set exactly once when health
/// reaches 0.  When a HealthAttribute is bound the applier mirrors health
/// into it and listens to it: damage the attribute reports on its own is
/// undone and re-applied here, while the echo of the applier's own write
/// is ignored through a self-mutating flag.
// /////////////////////////////////////////////////////////////////////////////
class MutationApplier final : public core::NonCopyable<MutationApplier>
{
public:
    using DeathCallback = std::function<void()>;

    MutationApplier(GroundTruthState &state, HealthAttribute *attribute, DeathCallback onDeath);
    ~MutationApplier();

    /// @return kInvalidArgument for a negative or non-finite amount.
    [[nodiscard]] core::Expected<MutationResult> apply(const MutationCommand &command);

    [[nodiscard]] bool      isSelfMutating() const noexcept;
    [[nodiscard]] core::u64 interceptedCount() const noexcept;
    [[nodiscard]] core::u64 ignoredEchoCount() const noexcept;

private:
    core::Expected<MutationResult> applyCommand(const MutationCommand &command, bool notifyListeners);
    void onLocalDamage(const DamageEvent &event);

    GroundTruthState               &_state;
    HealthAttribute                *_attribute;
    DeathCallback                   _onDeath;
    HealthAttribute::ListenerId     _listener{0};
    bool                            _selfMutating{false};
    core::u64                       _intercepted{0};
    core::u64                       _ignoredEchoes{0};
};

} // namespace rpl::replication
