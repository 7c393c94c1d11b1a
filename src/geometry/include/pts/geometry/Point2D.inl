/**
 * @file Point2D.inl
 * @brief Inline implementation of Point2D operations.
 * @see   Point2D.hpp
 */

#ifndef PTS_GEOMETRY_POINT2D_INL
    #define PTS_GEOMETRY_POINT2D_INL

    #include <sstream>

namespace pts::geometry {

template <core::Numeric N>
constexpr Point2D<N>::Point2D(N x_, N y_) : x(std::move(x_)), y(std::move(y_)) {}

template <core::Numeric N>
constexpr Point2D<N>::Point2D(const std::array<N, 2> &coords) : x(coords[0]), y(coords[1]) {}

template <core::Numeric N>
constexpr Point2D<N>::Point2D(const std::tuple<N, N> &coords)
    : x(std::get<0>(coords)), y(std::get<1>(coords))
{}

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::fromArray(const std::array<N, 2> &coords) { return Point2D{coords}; }

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::fromTuple(const std::tuple<N, N> &coords) { return Point2D{coords}; }

template <core::Numeric N>
constexpr std::array<N, 2> Point2D<N>::toArray() const { return {x, y}; }

template <core::Numeric N>
constexpr std::tuple<N, N> Point2D<N>::toTuple() const { return {x, y}; }

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::operator+(const Point2D &rhs) const
{
    return componentwise::combine(*this, rhs, std::plus<>{});
}

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::operator-(const Point2D &rhs) const
{
    return componentwise::combine(*this, rhs, std::minus<>{});
}

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::operator-() const
{
    return componentwise::apply(*this, std::negate<>{});
}

template <core::Numeric N>
constexpr Point2D<N> &Point2D<N>::operator+=(const Point2D &rhs) { *this = *this + rhs; return *this; }

template <core::Numeric N>
constexpr Point2D<N> &Point2D<N>::operator-=(const Point2D &rhs) { *this = *this - rhs; return *this; }

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::minValue() requires core::Bounded<N>
{
    const N lo = core::NumericTraits<N>::minValue();
    return {lo, lo};
}

template <core::Numeric N>
constexpr Point2D<N> Point2D<N>::maxValue() requires core::Bounded<N>
{
    const N hi = core::NumericTraits<N>::maxValue();
    return {hi, hi};
}

template <core::Numeric N>
core::Expected<N> Point2D<N>::hypotSq() const requires core::CheckedArithmetic<N>
{
    return componentwise::sumOfSquares(*this);
}

template <core::Numeric N>
template <core::usize I>
constexpr N &Point2D<N>::get() noexcept
{
    static_assert(I < kDimension, "Point2D index out of range");
    if constexpr (I == 0)
        return x;
    else
        return y;
}

template <core::Numeric N>
template <core::usize I>
constexpr const N &Point2D<N>::get() const noexcept
{
    static_assert(I < kDimension, "Point2D index out of range");
    if constexpr (I == 0)
        return x;
    else
        return y;
}

template <core::Formattable N>
std::ostream &operator<<(std::ostream &os, const Point2D<N> &point)
{
    return componentwise::write(os, point);
}

template <core::Formattable N>
std::string toString(const Point2D<N> &point)
{
    std::ostringstream out;
    out << point;
    return out.str();
}

} // namespace pts::geometry

#endif // PTS_GEOMETRY_POINT2D_INL
