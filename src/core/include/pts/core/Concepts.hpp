/**
 * @file Concepts.hpp
 * @brief C++20 concepts describing the numeric capabilities a coordinate
 *        type may offer.
 *
 * Each geometric operation constrains its element type on the smallest
 * capability it needs, so a type lacking e.g. checked arithmetic can
 * still be added, subtracted, compared and hashed.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_CORE_CONCEPTS_HPP
    #define PTS_CORE_CONCEPTS_HPP

    #include "NumericTraits.hpp"
    #include "Types.hpp"

    #include <concepts>
    #include <functional>
    #include <optional>
    #include <ostream>
    #include <type_traits>

namespace pts::core {

/**
 * @brief A copyable value with a zero (its default value), a one, and the
 *        ring operations + - * together with unary negation.
 */
template <typename N>
concept Numeric = std::regular<N> && requires(const N a, const N b) {
    N{1};
    { a + b } -> std::convertible_to<N>;
    { a - b } -> std::convertible_to<N>;
    { a * b } -> std::convertible_to<N>;
    { -a }    -> std::convertible_to<N>;
};

/**
 * @brief A numeric type whose NumericTraits expose overflow-detecting
 *        multiply and add.
 */
template <typename N>
concept CheckedArithmetic = Numeric<N> && requires(const N a, const N b) {
    { NumericTraits<N>::checkedMul(a, b) } -> std::same_as<std::optional<N>>;
    { NumericTraits<N>::checkedAdd(a, b) } -> std::same_as<std::optional<N>>;
};

/**
 * @brief A numeric type with a minimum and maximum representable value.
 */
template <typename N>
concept Bounded = Numeric<N> && requires {
    { NumericTraits<N>::minValue() } -> std::same_as<N>;
    { NumericTraits<N>::maxValue() } -> std::same_as<N>;
};

/**
 * @brief A numeric type that can be written to a std::ostream.
 */
template <typename N>
concept Formattable = Numeric<N> && requires(std::ostream &os, const N &value) {
    { os << value } -> std::convertible_to<std::ostream &>;
};

/**
 * @brief A numeric type usable as a std::hash key.
 */
template <typename N>
concept HashableNumeric = Numeric<N> && requires(const N &value) {
    { std::hash<N>{}(value) } -> std::convertible_to<usize>;
};

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to hash as raw bytes.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

} // namespace pts::core

#endif // PTS_CORE_CONCEPTS_HPP
