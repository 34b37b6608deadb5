/**
 * @file Vec3.hpp
 * @brief 3-component vector template used for entity positions.
 *
 * Parameterised on the scalar type; the replication layer instantiates it
 * with float, the wire precision of a snapshot.
 *
 * @tparam T Scalar type satisfying rpl::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RPL_MATH_VEC3_HPP
    #define RPL_MATH_VEC3_HPP

    #include <rpl/core/Concepts.hpp>

namespace rpl::math {

template <core::Arithmetic T>
struct Vec3 final {
    T x{};
    T y{};
    T z{};

    constexpr Vec3() = default;
    constexpr Vec3(T x, T y, T z);

    [[nodiscard]] constexpr Vec3 operator+(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator-(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator-()          const;

    constexpr Vec3 &operator+=(Vec3 rhs);
    constexpr Vec3 &operator-=(Vec3 rhs);
    constexpr Vec3 &operator*=(T scalar);

    [[nodiscard]] constexpr bool operator==(const Vec3 &rhs) const = default;

    [[nodiscard]] constexpr T    dot(Vec3 rhs)      const;
    [[nodiscard]] constexpr Vec3 cross(Vec3 rhs)    const;
    [[nodiscard]] constexpr T    lengthSquared()    const;
    [[nodiscard]] T              length()           const;
    [[nodiscard]] constexpr Vec3 normalize()        const;

    /// @brief Length of the horizontal (x, z) projection; y is ignored.
    [[nodiscard]] T              planarLength()     const;

    /// @brief True when every component is finite.
    [[nodiscard]] bool           isFinite()         const;

    static constexpr Vec3 zero();
    static constexpr Vec3 unitX();
    static constexpr Vec3 unitY();
    static constexpr Vec3 unitZ();
};

/**
 * @brief Horizontal distance between two points (x and z only).
 */
template <core::Arithmetic T>
[[nodiscard]] T planarDistance(Vec3<T> a, Vec3<T> b);

/**
 * @brief Component-wise linear interpolation, @p t not clamped.
 */
template <core::Arithmetic T>
[[nodiscard]] constexpr Vec3<T> lerp(Vec3<T> a, Vec3<T> b, T t);

using Vec3f  = Vec3<float>;
using Vec3d  = Vec3<double>;

} // namespace rpl::math

    #include "Vec3.inl"

#endif // RPL_MATH_VEC3_HPP
