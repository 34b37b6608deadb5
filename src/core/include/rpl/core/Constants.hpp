/**
 * @file Constants.hpp
 * @brief Compile-time defaults of the replication layer.
 *
 * Runtime values come from engine::Config; these are the defaults it
 * starts from and the wire constants shared by every participant.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RPL_CORE_CONSTANTS_HPP
    #define RPL_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rpl::core {

inline constexpr u32   kTickRate              = 60;
inline constexpr u32   kSendRate              = 10;

inline constexpr f32   kPositionLerpRate      = 10.0f;
inline constexpr f32   kRotationLerpRate      = 10.0f;
inline constexpr f32   kSnapDistance          = 5.0f;
inline constexpr f32   kMaxHealth             = 100.0f;

inline constexpr f64   kTeardownDelay         = 3.0;
inline constexpr u32   kSecondPassTickDelay   = 1;

inline constexpr u32   kMaxPayloadBytes       = 256;
inline constexpr u32   kMaxEntities           = 4'096;

} // namespace rpl::core

#endif // RPL_CORE_CONSTANTS_HPP
