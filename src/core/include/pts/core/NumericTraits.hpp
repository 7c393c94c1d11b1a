/**
 * @file NumericTraits.hpp
 * @brief Customization point for optional numeric capabilities.
 *
 * Checked arithmetic and representable bounds are not expressible through
 * plain operators, so they are looked up through NumericTraits<N>.  The
 * primary template is empty: a type only gains a capability once a
 * specialization provides the corresponding static members.
 *
 * Built-in integers get checked multiply/add and bounds.  Floating-point
 * types only get bounds, where minValue() is the most negative finite
 * value rather than the smallest positive normal.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_CORE_NUMERIC_TRAITS_HPP
    #define PTS_CORE_NUMERIC_TRAITS_HPP

    #include "Platform.hpp"

    #include <concepts>
    #include <limits>
    #include <optional>

namespace pts::core {

/**
 * @brief Capability table for a numeric type.
 *
 * Specializations may provide any subset of:
 *   - static std::optional<N> checkedMul(N, N)
 *   - static std::optional<N> checkedAdd(N, N)
 *   - static N minValue()
 *   - static N maxValue()
 *
 * @tparam N Numeric type.
 */
template <typename N>
struct NumericTraits {};

template <std::integral N>
    requires (!std::same_as<N, bool>)
struct NumericTraits<N> {
    /// @brief a * b, or std::nullopt if the product does not fit in N.
    [[nodiscard]] static constexpr std::optional<N> checkedMul(N a, N b) noexcept
    {
        N result{};
        if (PTS_UNLIKELY(__builtin_mul_overflow(a, b, &result)))
            return std::nullopt;
        return result;
    }

    /// @brief a + b, or std::nullopt if the sum does not fit in N.
    [[nodiscard]] static constexpr std::optional<N> checkedAdd(N a, N b) noexcept
    {
        N result{};
        if (PTS_UNLIKELY(__builtin_add_overflow(a, b, &result)))
            return std::nullopt;
        return result;
    }

    [[nodiscard]] static constexpr N minValue() noexcept { return std::numeric_limits<N>::min(); }
    [[nodiscard]] static constexpr N maxValue() noexcept { return std::numeric_limits<N>::max(); }
};

template <std::floating_point N>
struct NumericTraits<N> {
    [[nodiscard]] static constexpr N minValue() noexcept { return std::numeric_limits<N>::lowest(); }
    [[nodiscard]] static constexpr N maxValue() noexcept { return std::numeric_limits<N>::max(); }
};

} // namespace pts::core

#endif // PTS_CORE_NUMERIC_TRAITS_HPP
