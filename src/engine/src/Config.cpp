// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder and validation.
// /////////////////////////////////////////////////////////////////////////////

#include <rpl/engine/Config.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace rpl::engine {

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::sendRate(core::u32 hz) noexcept
{
    _sendRate = hz;
    return *this;
}

Config::Builder& Config::Builder::positionLerpRate(core::f32 perSecond) noexcept
{
    _positionLerpRate = perSecond;
    return *this;
}

Config::Builder& Config::Builder::rotationLerpRate(core::f32 perSecond) noexcept
{
    _rotationLerpRate = perSecond;
    return *this;
}

Config::Builder& Config::Builder::snapDistance(core::f32 metres) noexcept
{
    _snapDistance = metres;
    return *this;
}

Config::Builder& Config::Builder::maxHealth(core::f32 value) noexcept
{
    _maxHealth = value;
    return *this;
}

Config::Builder& Config::Builder::teardownDelay(core::f64 seconds) noexcept
{
    _teardownDelay = seconds;
    return *this;
}

Config::Builder& Config::Builder::secondPassTickDelay(core::u32 ticks) noexcept
{
    _secondPassTickDelay = ticks;
    return *this;
}

Config::Builder& Config::Builder::recheckOffsets(std::vector<core::f64> seconds)
{
    _recheckOffsets = std::move(seconds);
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._tickRate            = _tickRate;
    cfg._sendRate            = _sendRate;
    cfg._positionLerpRate    = _positionLerpRate;
    cfg._rotationLerpRate    = _rotationLerpRate;
    cfg._snapDistance        = _snapDistance;
    cfg._maxHealth           = _maxHealth;
    cfg._teardownDelay       = _teardownDelay;
    cfg._secondPassTickDelay = _secondPassTickDelay;
    cfg._recheckOffsets      = _recheckOffsets;
    cfg._logLevel            = _logLevel;
    return cfg;
}

core::f64 Config::fixedDeltaTime() const noexcept
{
    return _tickRate > 0 ? 1.0 / static_cast<core::f64>(_tickRate) : 0.0;
}

core::f64 Config::sendInterval() const noexcept
{
    return _sendRate > 0 ? 1.0 / static_cast<core::f64>(_sendRate) : 0.0;
}

core::Expected<void> Config::validate() const
{
    using core::ErrorCode;

    if (_tickRate == 0)
        return core::makeError(ErrorCode::kInvalidArgument, "Config: tickRate must be positive");
    if (_sendRate == 0)
        return core::makeError(ErrorCode::kInvalidArgument, "Config: sendRate must be positive");
    if (_sendRate > _tickRate)
    {
        return core::makeError(ErrorCode::kInvalidArgument,
                               "Config: sendRate " + std::to_string(_sendRate) + " exceeds tickRate " +
                                   std::to_string(_tickRate));
    }
    if (!(_positionLerpRate > 0.0f) || !(_rotationLerpRate > 0.0f))
        return core::makeError(ErrorCode::kInvalidArgument, "Config: lerp rates must be positive");
    if (!(_maxHealth > 0.0f) || !std::isfinite(_maxHealth))
        return core::makeError(ErrorCode::kInvalidArgument, "Config: maxHealth must be positive");
    if (!(_snapDistance >= 0.0f))
        return core::makeError(ErrorCode::kInvalidArgument, "Config: snapDistance must not be negative");
    if (!(_teardownDelay >= 0.0))
        return core::makeError(ErrorCode::kInvalidArgument, "Config: teardownDelay must not be negative");
    if (!std::is_sorted(_recheckOffsets.begin(), _recheckOffsets.end()))
        return core::makeError(ErrorCode::kInvalidArgument, "Config: recheckOffsets must be sorted");
    if (!_recheckOffsets.empty() && !(_recheckOffsets.front() >= 0.0))
        return core::makeError(ErrorCode::kInvalidArgument, "Config: recheckOffsets must not be negative");
    return {};
}

replication::ReplicationSettings Config::replication() const
{
    replication::ReplicationSettings settings;
    settings.positionLerpRate    = _positionLerpRate;
    settings.rotationLerpRate    = _rotationLerpRate;
    settings.snapDistance        = _snapDistance;
    settings.maxHealth           = _maxHealth;
    settings.teardownDelay       = _teardownDelay;
    settings.secondPassTickDelay = _secondPassTickDelay;
    settings.recheckOffsets      = _recheckOffsets;
    return settings;
}

} // namespace rpl::engine
