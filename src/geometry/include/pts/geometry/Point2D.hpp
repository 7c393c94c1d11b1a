/**
 * @file Point2D.hpp
 * @brief Two-dimensional point template over any Numeric coordinate type.
 *
 * Construction, conversion, arithmetic, equality and hashing only need
 * core::Numeric.  Bounds, hypotSq() and stream output are each gated on
 * the narrower capability they use.
 *
 * @tparam N Coordinate type satisfying pts::core::Numeric.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_GEOMETRY_POINT2D_HPP
    #define PTS_GEOMETRY_POINT2D_HPP

    #include <pts/core/Concepts.hpp>
    #include <pts/core/Expected.hpp>
    #include <pts/core/Types.hpp>
    #include <pts/geometry/Componentwise.hpp>

    #include <array>
    #include <functional>
    #include <ostream>
    #include <string>
    #include <tuple>

namespace pts::geometry {

template <core::Numeric N>
struct Point2D final {
    using value_type = N;

    static constexpr core::usize kDimension = 2;

    N x{};
    N y{};

    constexpr Point2D() = default;
    constexpr Point2D(N x_, N y_);

    /// @brief Build from an [x, y] array.
    constexpr explicit Point2D(const std::array<N, 2> &coords);

    /// @brief Build from an (x, y) tuple.
    constexpr explicit Point2D(const std::tuple<N, N> &coords);

    [[nodiscard]] static constexpr Point2D fromArray(const std::array<N, 2> &coords);
    [[nodiscard]] static constexpr Point2D fromTuple(const std::tuple<N, N> &coords);

    [[nodiscard]] constexpr std::array<N, 2> toArray() const;
    [[nodiscard]] constexpr std::tuple<N, N> toTuple() const;

    constexpr explicit operator std::array<N, 2>() const { return toArray(); }
    constexpr explicit operator std::tuple<N, N>() const { return toTuple(); }

    [[nodiscard]] constexpr Point2D operator+(const Point2D &rhs) const;
    [[nodiscard]] constexpr Point2D operator-(const Point2D &rhs) const;
    [[nodiscard]] constexpr Point2D operator-()                  const;

    constexpr Point2D &operator+=(const Point2D &rhs);
    constexpr Point2D &operator-=(const Point2D &rhs);

    [[nodiscard]] constexpr bool operator==(const Point2D &rhs) const = default;

    /// @brief Point with every coordinate at N's minimum representable value.
    [[nodiscard]] static constexpr Point2D minValue() requires core::Bounded<N>;

    /// @brief Point with every coordinate at N's maximum representable value.
    [[nodiscard]] static constexpr Point2D maxValue() requires core::Bounded<N>;

    /**
     * @brief Squared distance from the origin, x*x + y*y.
     *
     * Every multiply and add is checked; the first overflow aborts the
     * computation with ErrorCode::kArithmeticOverflow.
     */
    [[nodiscard]] core::Expected<N> hypotSq() const requires core::CheckedArithmetic<N>;

    /// @brief Tuple-like access, so that `auto [x, y] = point;` works.
    template <core::usize I>
    [[nodiscard]] constexpr N &get() noexcept;

    template <core::usize I>
    [[nodiscard]] constexpr const N &get() const noexcept;
};

/// @brief Writes "( x, y )".
template <core::Formattable N>
std::ostream &operator<<(std::ostream &os, const Point2D<N> &point);

/// @brief Same text as operator<<.
template <core::Formattable N>
[[nodiscard]] std::string toString(const Point2D<N> &point);

using Point2Di = Point2D<core::i32>;
using Point2Dl = Point2D<core::i64>;
using Point2Df = Point2D<core::f32>;
using Point2Dd = Point2D<core::f64>;

} // namespace pts::geometry

template <pts::core::Numeric N>
struct std::tuple_size<pts::geometry::Point2D<N>> : std::integral_constant<std::size_t, 2> {};

template <std::size_t I, pts::core::Numeric N>
struct std::tuple_element<I, pts::geometry::Point2D<N>> {
    static_assert(I < 2, "Point2D index out of range");
    using type = N;
};

// -------------------------------------------------------------------------- //
//  std::hash specialisation                                                  //
// -------------------------------------------------------------------------- //
template <pts::core::HashableNumeric N>
struct std::hash<pts::geometry::Point2D<N>>
{
    [[nodiscard]] std::size_t operator()(const pts::geometry::Point2D<N> &point) const noexcept
    {
        return pts::geometry::componentwise::hash(point);
    }
};

    #include "Point2D.inl"

#endif // PTS_GEOMETRY_POINT2D_HPP
