// /////////////////////////////////////////////////////////////////////////////
/// @file HealthAttribute.hpp
/// @brief Local health value with damage listeners (hit reactions, blood).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>

#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <functional>
#include <utility>
#include <vector>

namespace rpl::replication {

/** @brief Emitted whenever the attribute value drops. */
struct DamageEvent
{
    core::f32  amount{0.0f};
    Vec3f      position{};
    Vec3f      direction{};
    AttackerId attacker{net::protocol::kNoParticipant};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class HealthAttribute
/// @brief The entity's own damage side-effect system.
///
/// damage() and setValue() notify listeners whenever the value drops;
/// assign() and resetToMax() never do.  The value is kept in [0, max].
// /////////////////////////////////////////////////////////////////////////////
class HealthAttribute final : public core::NonCopyable<HealthAttribute>
{
public:
    using Listener   = std::function<void(const DamageEvent &)>;
    using ListenerId = core::u32;

    explicit HealthAttribute(core::f32 maxValue);
    ~HealthAttribute();

    [[nodiscard]] core::f32 value() const noexcept;
    [[nodiscard]] core::f32 max() const noexcept;

    ListenerId subscribe(Listener listener);
    bool unsubscribe(ListenerId id);

    /// @brief Local damage path (weapon hit on this process).
    void damage(core::f32 amount, Vec3f position, Vec3f direction, AttackerId attacker);

    /// @brief Writes the value, notifying listeners if it dropped.
    void setValue(core::f32 value);

    /// @brief Writes the value without notifying anyone.
    void assign(core::f32 value) noexcept;

    void resetToMax() noexcept;

private:
    void emit(const DamageEvent &event);

    core::f32                                    _max;
    core::f32                                    _value;
    std::vector<std::pair<ListenerId, Listener>> _listeners;
    ListenerId                                   _nextId{1};
};

} // namespace rpl::replication
