/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces across the layer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RPL_CORE_CONCEPTS_HPP
    #define RPL_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace rpl::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A floating-point scalar usable for interpolation.
 */
template <typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

} // namespace rpl::core

#endif // RPL_CORE_CONCEPTS_HPP
