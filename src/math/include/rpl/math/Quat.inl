/**
 * @file Quat.inl
 * @brief Inline implementation of quaternion operations.
 * @see   Quat.hpp
 */

#ifndef RPL_MATH_QUAT_INL
    #define RPL_MATH_QUAT_INL

#include <algorithm>
#include <cmath>

namespace rpl::math {

template <core::Arithmetic T>
constexpr Quat<T>::Quat(T w_, T x_, T y_, T z_) : w(w_), x(x_), y(y_), z(z_) {}

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::operator*(Quat rhs) const
{
    return {
        w * rhs.w - x * rhs.x - y * rhs.y - z * rhs.z,
        w * rhs.x + x * rhs.w + y * rhs.z - z * rhs.y,
        w * rhs.y - x * rhs.z + y * rhs.w + z * rhs.x,
        w * rhs.z + x * rhs.y - y * rhs.x + z * rhs.w
    };
}

template <core::Arithmetic T>
constexpr Vec3<T> Quat<T>::rotate(Vec3<T> v) const
{
    Vec3<T> qVec{x, y, z};
    Vec3<T> t = qVec.cross(v) * (T{2});
    return v + t * w + qVec.cross(t);
}

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::conjugate() const { return {w, -x, -y, -z}; }

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::inverse() const
{
    T lenSq = lengthSquared();
    Quat c  = conjugate();
    return {c.w / lenSq, c.x / lenSq, c.y / lenSq, c.z / lenSq};
}

template <core::Arithmetic T>
constexpr T Quat<T>::dot(Quat rhs) const
{
    return w * rhs.w + x * rhs.x + y * rhs.y + z * rhs.z;
}

template <core::Arithmetic T>
constexpr T Quat<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::normalize() const
{
    if constexpr (std::is_floating_point_v<T>) {
        T lenSq = lengthSquared();
        if (lenSq <= T{})
            return identity();
        T inv = T(1) / std::sqrt(lenSq);
        return {w * inv, x * inv, y * inv, z * inv};
    } else {
        return *this;
    }
}

template <core::Arithmetic T>
bool Quat<T>::isFinite() const
{
    return std::isfinite(w) && std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}

template <core::Arithmetic T>
T Quat<T>::angleTo(Quat rhs) const
{
    T d = std::abs(normalize().dot(rhs.normalize()));
    d   = std::min(d, T{1});
    return T{2} * std::acos(d);
}

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::identity() { return {T{1}, T{}, T{}, T{}}; }

template <core::Arithmetic T>
Quat<T> Quat<T>::fromAxisAngle(Vec3<T> axis, T angleRad)
{
    const Vec3<T> n = axis.normalize();
    const T half    = angleRad * T(0.5);
    const T s       = std::sin(half);
    return {std::cos(half), n.x * s, n.y * s, n.z * s};
}

template <core::Arithmetic T>
Quat<T> Quat<T>::slerp(Quat a, Quat b, T t)
{
    t = std::clamp(t, T{}, T{1});
    a = a.normalize();
    b = b.normalize();

    T cosTheta = a.dot(b);
    if (cosTheta < T{}) {
        b        = {-b.w, -b.x, -b.y, -b.z};
        cosTheta = -cosTheta;
    }

    if (cosTheta > T(0.9995)) {
        Quat r{
            a.w + (b.w - a.w) * t,
            a.x + (b.x - a.x) * t,
            a.y + (b.y - a.y) * t,
            a.z + (b.z - a.z) * t
        };
        return r.normalize();
    }

    const T theta    = std::acos(cosTheta);
    const T sinTheta = std::sin(theta);
    const T wa       = std::sin((T{1} - t) * theta) / sinTheta;
    const T wb       = std::sin(t * theta) / sinTheta;
    return {
        a.w * wa + b.w * wb,
        a.x * wa + b.x * wb,
        a.y * wa + b.y * wb,
        a.z * wa + b.z * wb
    };
}

} // namespace rpl::math

#endif // RPL_MATH_QUAT_INL
