/**
 * @file MutationApplier.cpp
 * @brief MutationApplier implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/MutationApplier.hpp>

#include <rpl/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace rpl::replication {

namespace {

/** @brief Raises a flag for the lifetime of the scope. */
class ScopedFlag final
{
public:
    explicit ScopedFlag(bool &flag) noexcept : _flag{flag}, _previous{flag} { _flag = true; }
    ~ScopedFlag() { _flag = _previous; }

    ScopedFlag(const ScopedFlag &) = delete;
    ScopedFlag &operator=(const ScopedFlag &) = delete;

private:
    bool &_flag;
    bool  _previous;
};

} // namespace

std::string_view toString(MutationResult result) noexcept
{
    switch (result)
    {
    case MutationResult::kApplied:     return "Applied";
    case MutationResult::kKilled:      return "Killed";
    case MutationResult::kIgnoredDead: return "IgnoredDead";
    }
    return "Unknown";
}

MutationApplier::MutationApplier(GroundTruthState &state, HealthAttribute *attribute, DeathCallback onDeath)
    : _state{state}
    , _attribute{attribute}
    , _onDeath{std::move(onDeath)}
{
    if (_attribute)
    {
        _listener = _attribute->subscribe([this](const DamageEvent &event) { onLocalDamage(event); });
    }
}

MutationApplier::~MutationApplier()
{
    if (_attribute)
        _attribute->unsubscribe(_listener);
}

core::Expected<MutationResult> MutationApplier::apply(const MutationCommand &command)
{
    return applyCommand(command, true);
}

core::Expected<MutationResult> MutationApplier::applyCommand(const MutationCommand &command, bool notifyListeners)
{
    if (!std::isfinite(command.amount) || command.amount < 0.0f)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "MutationApplier: invalid damage amount " + std::to_string(command.amount));
    }

    if (_state.isDead)
    {
        core::Log::debug("REPL", "MutationApplier: entity already dead, damage ignored");
        return MutationResult::kIgnoredDead;
    }

    bool died = false;
    {
        ScopedFlag guard{_selfMutating};
        _state.health = std::max(_state.health - command.amount, 0.0f);
        if (_attribute && notifyListeners)
            _attribute->setValue(_state.health);
        else if (_attribute)
            _attribute->assign(_state.health);

        if (_state.health <= 0.0f && !_state.isDead)
        {
            _state.isDead = true;
            died          = true;
        }
    }

    core::Log::debug("REPL", "MutationApplier: applied " + std::to_string(command.amount) +
                                 " damage, health now " + std::to_string(_state.health));

    if (!died)
        return MutationResult::kApplied;

    core::Log::info("REPL", "MutationApplier: entity died (attacker " + std::to_string(command.attacker) + ")");
    if (_onDeath)
        _onDeath();
    return MutationResult::kKilled;
}

void MutationApplier::onLocalDamage(const DamageEvent &event)
{
    if (_selfMutating)
    {
        ++_ignoredEchoes;
        return;
    }
    if (_state.isDead)
        return;

    ++_intercepted;
    _attribute->assign(_state.health);

    // Listeners already saw this hit; the mirrored value must not emit it again.
    auto result = applyCommand(MutationCommand{event.amount, event.position, event.direction, event.attacker}, false);
    if (!result)
    {
        core::Log::warn("REPL", "MutationApplier: intercepted damage rejected: " + result.error().describe());
    }
}

bool MutationApplier::isSelfMutating() const noexcept { return _selfMutating; }
core::u64 MutationApplier::interceptedCount() const noexcept { return _intercepted; }
core::u64 MutationApplier::ignoredEchoCount() const noexcept { return _ignoredEchoes; }

} // namespace rpl::replication
