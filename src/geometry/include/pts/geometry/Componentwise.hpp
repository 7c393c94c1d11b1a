/**
 * @file Componentwise.hpp
 * @brief Coordinate-wise map, zip and fold shared by every point type.
 *
 * Point2D and Point3D differ only in their number of coordinates, so their
 * operators are written once here against the CoordinateTuple interface:
 * a static kDimension, toArray() and fromArray().
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_GEOMETRY_COMPONENTWISE_HPP
    #define PTS_GEOMETRY_COMPONENTWISE_HPP

    #include <pts/core/Concepts.hpp>
    #include <pts/core/Expected.hpp>
    #include <pts/core/Fnv1a.hpp>
    #include <pts/core/Platform.hpp>
    #include <pts/core/Types.hpp>

    #include <array>
    #include <charconv>
    #include <concepts>
    #include <functional>
    #include <iterator>
    #include <optional>
    #include <ostream>
    #include <string>
    #include <system_error>
    #include <utility>

namespace pts::geometry {

/**
 * @brief A fixed-arity point that can be flattened to, and rebuilt from,
 *        an array of its coordinates.
 */
template <typename P>
concept CoordinateTuple = core::Numeric<typename P::value_type> && requires(const P &p) {
    { P::kDimension } -> std::convertible_to<core::usize>;
    { p.toArray() } -> std::same_as<std::array<typename P::value_type, P::kDimension>>;
    { P::fromArray(p.toArray()) } -> std::same_as<P>;
};

namespace componentwise {

namespace detail {

inline constexpr const char *kAxisNames[] = {"x", "y", "z"};

/**
 * Floating coordinates are written as the shortest text that reads back to
 * the same value; single-byte integers as numbers rather than characters.
 */
template <typename N>
void writeCoordinate(std::ostream &os, const N &value)
{
    if constexpr (std::floating_point<N>)
    {
        std::array<char, 64> buffer{};
        const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
        if (ec == std::errc{})
            os.write(buffer.data(), end - buffer.data());
        else
            os << value;
    }
    else if constexpr (std::integral<N> && sizeof(N) == 1 && !std::same_as<N, bool>)
        os << +value;
    else
        os << value;
}

} // namespace detail

/**
 * @brief Apply @p f to every coordinate of @p point.
 * @return A point of the same type holding f(c) for each coordinate c.
 */
template <CoordinateTuple P, typename F>
[[nodiscard]] constexpr P apply(const P &point, F &&f)
{
    using N = typename P::value_type;
    auto coords = point.toArray();
    for (auto &c : coords)
        c = static_cast<N>(std::invoke(f, std::as_const(c)));
    return P::fromArray(coords);
}

/**
 * @brief Zip two points coordinate by coordinate through @p f.
 */
template <CoordinateTuple P, typename F>
[[nodiscard]] constexpr P combine(const P &lhs, const P &rhs, F &&f)
{
    using N = typename P::value_type;
    const auto a = lhs.toArray();
    const auto b = rhs.toArray();
    std::array<N, P::kDimension> out{};
    for (core::usize i = 0; i < P::kDimension; ++i)
        out[i] = static_cast<N>(std::invoke(f, a[i], b[i]));
    return P::fromArray(out);
}

/**
 * @brief Left fold over the coordinates in axis order (x, y[, z]).
 */
template <CoordinateTuple P, typename T, typename F>
[[nodiscard]] constexpr T fold(const P &point, T init, F &&f)
{
    for (const auto &c : point.toArray())
        init = std::invoke(f, std::move(init), c);
    return init;
}

/**
 * @brief Sum of the squared coordinates using checked multiply and add.
 *
 * Stops at the first multiply or add that overflows and reports it as
 * ErrorCode::kArithmeticOverflow; a partial sum is never returned.
 */
template <CoordinateTuple P>
    requires core::CheckedArithmetic<typename P::value_type>
[[nodiscard]] core::Expected<typename P::value_type> sumOfSquares(const P &point)
{
    using N      = typename P::value_type;
    using Traits = core::NumericTraits<N>;
    static_assert(P::kDimension <= std::size(detail::kAxisNames));

    const auto coords = point.toArray();
    N sum{};
    for (core::usize i = 0; i < P::kDimension; ++i)
    {
        const std::optional<N> square = Traits::checkedMul(coords[i], coords[i]);
        if (PTS_UNLIKELY(!square))
            return core::makeError(core::ErrorCode::kArithmeticOverflow,
                                   std::string("checked multiply overflowed on coordinate ") + detail::kAxisNames[i]);

        const std::optional<N> next = Traits::checkedAdd(sum, *square);
        if (PTS_UNLIKELY(!next))
            return core::makeError(core::ErrorCode::kArithmeticOverflow,
                                   std::string("checked add overflowed on coordinate ") + detail::kAxisNames[i]);
        sum = *next;
    }
    return sum;
}

/**
 * @brief Hash of a point: FNV-1a over each coordinate's std::hash.
 */
template <CoordinateTuple P>
    requires core::HashableNumeric<typename P::value_type>
[[nodiscard]] core::usize hash(const P &point) noexcept
{
    using N = typename P::value_type;
    const core::Fnv1a mixed = fold(point, core::Fnv1a{}, [](core::Fnv1a acc, const N &c) {
        acc.combine(static_cast<core::u64>(std::hash<N>{}(c)));
        return acc;
    });
    return static_cast<core::usize>(mixed.digest());
}

/**
 * @brief Write @p point as "( c0, c1[, c2] )".
 */
template <CoordinateTuple P>
    requires core::Formattable<typename P::value_type>
std::ostream &write(std::ostream &os, const P &point)
{
    const auto coords = point.toArray();
    os << "( ";
    for (core::usize i = 0; i < P::kDimension; ++i)
    {
        if (i != 0)
            os << ", ";
        detail::writeCoordinate(os, coords[i]);
    }
    return os << " )";
}

} // namespace componentwise

} // namespace pts::geometry

#endif // PTS_GEOMETRY_COMPONENTWISE_HPP
