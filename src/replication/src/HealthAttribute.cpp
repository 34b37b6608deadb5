/**
 * @file HealthAttribute.cpp
 * @brief HealthAttribute implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/HealthAttribute.hpp>

#include <algorithm>

namespace rpl::replication {

HealthAttribute::HealthAttribute(core::f32 maxValue)
    : _max{maxValue}
    , _value{maxValue}
{}

HealthAttribute::~HealthAttribute() = default;

core::f32 HealthAttribute::value() const noexcept { return _value; }
core::f32 HealthAttribute::max() const noexcept { return _max; }

HealthAttribute::ListenerId HealthAttribute::subscribe(Listener listener)
{
    const ListenerId id = _nextId++;
    _listeners.emplace_back(id, std::move(listener));
    return id;
}

bool HealthAttribute::unsubscribe(ListenerId id)
{
    auto it = std::find_if(_listeners.begin(), _listeners.end(),
                           [id](const auto &entry) { return entry.first == id; });
    if (it == _listeners.end())
        return false;
    _listeners.erase(it);
    return true;
}

void HealthAttribute::damage(core::f32 amount, Vec3f position, Vec3f direction, AttackerId attacker)
{
    const core::f32 before = _value;
    _value = std::clamp(_value - amount, 0.0f, _max);
    if (_value < before)
        emit(DamageEvent{before - _value, position, direction, attacker});
}

void HealthAttribute::setValue(core::f32 value)
{
    const core::f32 before = _value;
    _value = std::clamp(value, 0.0f, _max);
    if (_value < before)
        emit(DamageEvent{before - _value, {}, {}, net::protocol::kNoParticipant});
}

void HealthAttribute::assign(core::f32 value) noexcept { _value = std::clamp(value, 0.0f, _max); }

void HealthAttribute::resetToMax() noexcept { _value = _max; }

void HealthAttribute::emit(const DamageEvent &event)
{
    // Listeners may (un)subscribe while being notified.
    const auto listeners = _listeners;
    for (const auto &[id, listener] : listeners)
        listener(event);
}

} // namespace rpl::replication
