/**
 * @file Point3D.inl
 * @brief Inline implementation of Point3D operations.
 * @see   Point3D.hpp
 */

#ifndef PTS_GEOMETRY_POINT3D_INL
    #define PTS_GEOMETRY_POINT3D_INL

    #include <sstream>

namespace pts::geometry {

template <core::Numeric N>
constexpr Point3D<N>::Point3D(N x_, N y_, N z_) : xy(std::move(x_), std::move(y_)), z(std::move(z_)) {}

template <core::Numeric N>
constexpr Point3D<N>::Point3D(Point2D<N> xy_, N z_) : xy(std::move(xy_)), z(std::move(z_)) {}

template <core::Numeric N>
constexpr Point3D<N>::Point3D(const std::array<N, 3> &coords)
    : xy(std::array<N, 2>{coords[0], coords[1]}), z(coords[2])
{}

template <core::Numeric N>
constexpr Point3D<N>::Point3D(const std::tuple<N, N, N> &coords)
    : Point3D(std::array<N, 3>{std::get<0>(coords), std::get<1>(coords), std::get<2>(coords)})
{}

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::fromArray(const std::array<N, 3> &coords) { return Point3D{coords}; }

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::fromTuple(const std::tuple<N, N, N> &coords) { return Point3D{coords}; }

template <core::Numeric N>
constexpr std::array<N, 3> Point3D<N>::toArray() const
{
    const auto [x_, y_] = xy.toArray();
    return {x_, y_, z};
}

template <core::Numeric N>
constexpr std::tuple<N, N, N> Point3D<N>::toTuple() const
{
    const auto [x_, y_, z_] = toArray();
    return {x_, y_, z_};
}

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::operator+(const Point3D &rhs) const
{
    return componentwise::combine(*this, rhs, std::plus<>{});
}

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::operator-(const Point3D &rhs) const
{
    return componentwise::combine(*this, rhs, std::minus<>{});
}

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::operator-() const
{
    return componentwise::apply(*this, std::negate<>{});
}

template <core::Numeric N>
constexpr Point3D<N> &Point3D<N>::operator+=(const Point3D &rhs) { *this = *this + rhs; return *this; }

template <core::Numeric N>
constexpr Point3D<N> &Point3D<N>::operator-=(const Point3D &rhs) { *this = *this - rhs; return *this; }

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::minValue() requires core::Bounded<N>
{
    return {Point2D<N>::minValue(), core::NumericTraits<N>::minValue()};
}

template <core::Numeric N>
constexpr Point3D<N> Point3D<N>::maxValue() requires core::Bounded<N>
{
    return {Point2D<N>::maxValue(), core::NumericTraits<N>::maxValue()};
}

template <core::Numeric N>
core::Expected<N> Point3D<N>::hypotSq() const requires core::CheckedArithmetic<N>
{
    return componentwise::sumOfSquares(*this);
}

template <core::Numeric N>
template <core::usize I>
constexpr N &Point3D<N>::get() noexcept
{
    static_assert(I < kDimension, "Point3D index out of range");
    if constexpr (I < Point2D<N>::kDimension)
        return xy.template get<I>();
    else
        return z;
}

template <core::Numeric N>
template <core::usize I>
constexpr const N &Point3D<N>::get() const noexcept
{
    static_assert(I < kDimension, "Point3D index out of range");
    if constexpr (I < Point2D<N>::kDimension)
        return xy.template get<I>();
    else
        return z;
}

template <core::Formattable N>
std::ostream &operator<<(std::ostream &os, const Point3D<N> &point)
{
    return componentwise::write(os, point);
}

template <core::Formattable N>
std::string toString(const Point3D<N> &point)
{
    std::ostringstream out;
    out << point;
    return out.str();
}

} // namespace pts::geometry

#endif // PTS_GEOMETRY_POINT3D_INL
