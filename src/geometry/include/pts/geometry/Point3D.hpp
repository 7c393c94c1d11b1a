/**
 * @file Point3D.hpp
 * @brief Three-dimensional point composed of a Point2D and a z coordinate.
 *
 * The first two coordinates live in the embedded Point2D `xy`.  The x()
 * and y() accessors return references into `xy`, so reading or writing
 * through them is exactly reading or writing `xy.x` / `xy.y`; there is no
 * second copy of those coordinates.
 *
 * @tparam N Coordinate type satisfying pts::core::Numeric.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_GEOMETRY_POINT3D_HPP
    #define PTS_GEOMETRY_POINT3D_HPP

    #include <pts/core/Concepts.hpp>
    #include <pts/core/Expected.hpp>
    #include <pts/core/Types.hpp>
    #include <pts/geometry/Componentwise.hpp>
    #include <pts/geometry/Point2D.hpp>

    #include <array>
    #include <functional>
    #include <ostream>
    #include <string>
    #include <tuple>

namespace pts::geometry {

template <core::Numeric N>
struct Point3D final {
    using value_type = N;

    static constexpr core::usize kDimension = 3;

    Point2D<N> xy{};
    N          z{};

    constexpr Point3D() = default;
    constexpr Point3D(N x_, N y_, N z_);
    constexpr Point3D(Point2D<N> xy_, N z_);

    /// @brief Build from an [x, y, z] array.
    constexpr explicit Point3D(const std::array<N, 3> &coords);

    /// @brief Build from an (x, y, z) tuple.
    constexpr explicit Point3D(const std::tuple<N, N, N> &coords);

    [[nodiscard]] static constexpr Point3D fromArray(const std::array<N, 3> &coords);
    [[nodiscard]] static constexpr Point3D fromTuple(const std::tuple<N, N, N> &coords);

    [[nodiscard]] constexpr std::array<N, 3>    toArray() const;
    [[nodiscard]] constexpr std::tuple<N, N, N> toTuple() const;

    constexpr explicit operator std::array<N, 3>()    const { return toArray(); }
    constexpr explicit operator std::tuple<N, N, N>() const { return toTuple(); }

    [[nodiscard]] constexpr N       &x()       noexcept { return xy.x; }
    [[nodiscard]] constexpr const N &x() const noexcept { return xy.x; }
    [[nodiscard]] constexpr N       &y()       noexcept { return xy.y; }
    [[nodiscard]] constexpr const N &y() const noexcept { return xy.y; }

    [[nodiscard]] constexpr Point3D operator+(const Point3D &rhs) const;
    [[nodiscard]] constexpr Point3D operator-(const Point3D &rhs) const;
    [[nodiscard]] constexpr Point3D operator-()                  const;

    constexpr Point3D &operator+=(const Point3D &rhs);
    constexpr Point3D &operator-=(const Point3D &rhs);

    [[nodiscard]] constexpr bool operator==(const Point3D &rhs) const = default;

    [[nodiscard]] static constexpr Point3D minValue() requires core::Bounded<N>;
    [[nodiscard]] static constexpr Point3D maxValue() requires core::Bounded<N>;

    /**
     * @brief Squared distance from the origin, x*x + y*y + z*z.
     *
     * Same checked, stop-at-first-overflow policy as Point2D::hypotSq().
     */
    [[nodiscard]] core::Expected<N> hypotSq() const requires core::CheckedArithmetic<N>;

    /// @brief Tuple-like access, so that `auto [x, y, z] = point;` works.
    template <core::usize I>
    [[nodiscard]] constexpr N &get() noexcept;

    template <core::usize I>
    [[nodiscard]] constexpr const N &get() const noexcept;
};

/// @brief Writes "( x, y, z )".
template <core::Formattable N>
std::ostream &operator<<(std::ostream &os, const Point3D<N> &point);

template <core::Formattable N>
[[nodiscard]] std::string toString(const Point3D<N> &point);

using Point3Di = Point3D<core::i32>;
using Point3Dl = Point3D<core::i64>;
using Point3Df = Point3D<core::f32>;
using Point3Dd = Point3D<core::f64>;

} // namespace pts::geometry

template <pts::core::Numeric N>
struct std::tuple_size<pts::geometry::Point3D<N>> : std::integral_constant<std::size_t, 3> {};

template <std::size_t I, pts::core::Numeric N>
struct std::tuple_element<I, pts::geometry::Point3D<N>> {
    static_assert(I < 3, "Point3D index out of range");
    using type = N;
};

// -------------------------------------------------------------------------- //
//  std::hash specialisation                                                  //
// -------------------------------------------------------------------------- //
template <pts::core::HashableNumeric N>
struct std::hash<pts::geometry::Point3D<N>>
{
    [[nodiscard]] std::size_t operator()(const pts::geometry::Point3D<N> &point) const noexcept
    {
        return pts::geometry::componentwise::hash(point);
    }
};

    #include "Point3D.inl"

#endif // PTS_GEOMETRY_POINT3D_HPP
