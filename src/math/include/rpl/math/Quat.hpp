/**
 * @file Quat.hpp
 * @brief Quaternion type for 3D rotation, parameterised on scalar type.
 *
 * Uses Hamilton convention (w, x, y, z) where w is the real part.  This
 * is also the order in which a rotation travels inside a snapshot.
 *
 * @tparam T Scalar type satisfying rpl::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RPL_MATH_QUAT_HPP
    #define RPL_MATH_QUAT_HPP

    #include "Vec3.hpp"

namespace rpl::math {

template <core::Arithmetic T>
struct Quat final {
    T w{T{1}};
    T x{};
    T y{};
    T z{};

    constexpr Quat() = default;
    constexpr Quat(T w, T x, T y, T z);

    [[nodiscard]] constexpr Quat  operator*(Quat rhs)       const;
    [[nodiscard]] constexpr Vec3<T> rotate(Vec3<T> v)        const;
    [[nodiscard]] constexpr Quat  conjugate()                const;
    [[nodiscard]] constexpr Quat  inverse()                  const;
    [[nodiscard]] constexpr T     dot(Quat rhs)              const;
    [[nodiscard]] constexpr T     lengthSquared()            const;
    [[nodiscard]] constexpr Quat  normalize()                const;
    [[nodiscard]] bool            isFinite()                 const;

    /**
     * @brief Angle in radians between the two orientations, in [0, pi].
     */
    [[nodiscard]] T angleTo(Quat rhs) const;

    static constexpr Quat identity();
    static Quat fromAxisAngle(Vec3<T> axis, T angleRad);

    /**
     * @brief Spherical interpolation along the shortest arc.
     *
     * @p t is clamped to [0, 1]; inputs are normalized first.  Falls back
     * to normalized linear interpolation when the orientations are nearly
     * parallel.
     */
    static Quat slerp(Quat a, Quat b, T t);
};

using Quatf = Quat<float>;

} // namespace rpl::math

    #include "Quat.inl"

#endif // RPL_MATH_QUAT_HPP
