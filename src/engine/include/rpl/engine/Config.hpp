// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Participant configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises every tuneable replication parameter.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rpl/replication/ReplicationSettings.hpp>

#include <rpl/core/Constants.hpp>
#include <rpl/core/Expected.hpp>
#include <rpl/core/Log.hpp>
#include <rpl/core/Types.hpp>

#include <vector>

namespace rpl::engine {

/// @brief Immutable participant configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& tickRate(core::u32 hz) noexcept;
        Builder& sendRate(core::u32 hz) noexcept;
        Builder& positionLerpRate(core::f32 perSecond) noexcept;
        Builder& rotationLerpRate(core::f32 perSecond) noexcept;
        Builder& snapDistance(core::f32 metres) noexcept;
        Builder& maxHealth(core::f32 value) noexcept;
        Builder& teardownDelay(core::f64 seconds) noexcept;
        Builder& secondPassTickDelay(core::u32 ticks) noexcept;
        Builder& recheckOffsets(std::vector<core::f64> seconds);
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const;

    private:
        core::u32              _tickRate{core::kTickRate};
        core::u32              _sendRate{core::kSendRate};
        core::f32              _positionLerpRate{core::kPositionLerpRate};
        core::f32              _rotationLerpRate{core::kRotationLerpRate};
        core::f32              _snapDistance{core::kSnapDistance};
        core::f32              _maxHealth{core::kMaxHealth};
        core::f64              _teardownDelay{core::kTeardownDelay};
        core::u32              _secondPassTickDelay{core::kSecondPassTickDelay};
        std::vector<core::f64> _recheckOffsets{0.5, 1.5, 3.0};
        core::LogLevel         _logLevel{core::LogLevel::kInfo};
    };

    [[nodiscard]] core::u32      tickRate()            const noexcept { return _tickRate; }
    [[nodiscard]] core::u32      sendRate()            const noexcept { return _sendRate; }
    [[nodiscard]] core::f32      positionLerpRate()    const noexcept { return _positionLerpRate; }
    [[nodiscard]] core::f32      rotationLerpRate()    const noexcept { return _rotationLerpRate; }
    [[nodiscard]] core::f32      snapDistance()        const noexcept { return _snapDistance; }
    [[nodiscard]] core::f32      maxHealth()           const noexcept { return _maxHealth; }
    [[nodiscard]] core::f64      teardownDelay()       const noexcept { return _teardownDelay; }
    [[nodiscard]] core::u32      secondPassTickDelay() const noexcept { return _secondPassTickDelay; }
    [[nodiscard]] const std::vector<core::f64> &recheckOffsets() const noexcept { return _recheckOffsets; }
    [[nodiscard]] core::LogLevel logLevel()            const noexcept { return _logLevel; }

    /// @brief Seconds per simulation tick.
    [[nodiscard]] core::f64 fixedDeltaTime() const noexcept;

    /// @brief Seconds between two snapshots of one entity.
    [[nodiscard]] core::f64 sendInterval() const noexcept;

    /// @brief Rejects values the replication layer cannot run with.
    [[nodiscard]] core::Expected<void> validate() const;

    /// @brief The subset handed to every replicated entity.
    [[nodiscard]] replication::ReplicationSettings replication() const;

private:
    friend class Builder;

    core::u32              _tickRate{core::kTickRate};
    core::u32              _sendRate{core::kSendRate};
    core::f32              _positionLerpRate{core::kPositionLerpRate};
    core::f32              _rotationLerpRate{core::kRotationLerpRate};
    core::f32              _snapDistance{core::kSnapDistance};
    core::f32              _maxHealth{core::kMaxHealth};
    core::f64              _teardownDelay{core::kTeardownDelay};
    core::u32              _secondPassTickDelay{core::kSecondPassTickDelay};
    std::vector<core::f64> _recheckOffsets{0.5, 1.5, 3.0};
    core::LogLevel         _logLevel{core::LogLevel::kInfo};
};

} // namespace rpl::engine
