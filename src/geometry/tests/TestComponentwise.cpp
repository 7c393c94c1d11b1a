/**
 * @file TestComponentwise.cpp
 * @brief Unit tests for pts::geometry::componentwise and for points over
 *        user-defined coordinate types.
 */

#include <catch2/catch.hpp>

#include <pts/geometry/Componentwise.hpp>
#include <pts/geometry/Point2D.hpp>
#include <pts/geometry/Point3D.hpp>

#include <optional>

using namespace pts;
using namespace pts::geometry;

namespace {

/// Ring operations only: no checked arithmetic, bounds, hashing or output.
struct Meters {
    int value{};

    friend constexpr Meters operator+(Meters a, Meters b) { return {a.value + b.value}; }
    friend constexpr Meters operator-(Meters a, Meters b) { return {a.value - b.value}; }
    friend constexpr Meters operator*(Meters a, Meters b) { return {a.value * b.value}; }
    friend constexpr Meters operator-(Meters a)           { return {-a.value}; }
    friend constexpr bool   operator==(Meters, Meters) = default;
};

/// Opts into checked arithmetic and bounds through NumericTraits.
struct Ticks {
    core::i16 count{};

    friend constexpr Ticks operator+(Ticks a, Ticks b) { return {static_cast<core::i16>(a.count + b.count)}; }
    friend constexpr Ticks operator-(Ticks a, Ticks b) { return {static_cast<core::i16>(a.count - b.count)}; }
    friend constexpr Ticks operator*(Ticks a, Ticks b) { return {static_cast<core::i16>(a.count * b.count)}; }
    friend constexpr Ticks operator-(Ticks a)          { return {static_cast<core::i16>(-a.count)}; }
    friend constexpr bool  operator==(Ticks, Ticks) = default;
};

} // namespace

template <>
struct pts::core::NumericTraits<Ticks> {
    using Raw = NumericTraits<core::i16>;

    static constexpr std::optional<Ticks> checkedMul(Ticks a, Ticks b) noexcept
    {
        const auto raw = Raw::checkedMul(a.count, b.count);
        return raw ? std::optional<Ticks>{Ticks{*raw}} : std::nullopt;
    }

    static constexpr std::optional<Ticks> checkedAdd(Ticks a, Ticks b) noexcept
    {
        const auto raw = Raw::checkedAdd(a.count, b.count);
        return raw ? std::optional<Ticks>{Ticks{*raw}} : std::nullopt;
    }

    static constexpr Ticks minValue() noexcept { return {Raw::minValue()}; }
    static constexpr Ticks maxValue() noexcept { return {Raw::maxValue()}; }
};

namespace {

template <typename P>
concept HasHypotSq = requires(const P &p) { p.hypotSq(); };

template <typename P>
concept HasBounds = requires { P::minValue(); P::maxValue(); };

} // namespace

TEST_CASE("componentwise::apply maps every coordinate", "[geometry][componentwise]")
{
    const auto doubled = componentwise::apply(Point3D{1, -2, 3}, [](int c) { return c * 2; });

    REQUIRE(doubled == Point3D{2, -4, 6});
}

TEST_CASE("componentwise::combine zips two points", "[geometry][componentwise]")
{
    const auto product = componentwise::combine(Point2D{2, 3}, Point2D{4, 5}, [](int a, int b) { return a * b; });

    REQUIRE(product == Point2D{8, 15});
}

TEST_CASE("componentwise::fold visits coordinates in axis order", "[geometry][componentwise]")
{
    const int digits = componentwise::fold(Point3D{1, 2, 3}, 0, [](int acc, int c) { return acc * 10 + c; });

    REQUIRE(digits == 123);
}

TEST_CASE("Points over a ring-only type keep the basic operations", "[geometry][componentwise][capability]")
{
    STATIC_REQUIRE(CoordinateTuple<Point2D<Meters>>);
    STATIC_REQUIRE(CoordinateTuple<Point3D<Meters>>);
    STATIC_REQUIRE_FALSE(HasHypotSq<Point2D<Meters>>);
    STATIC_REQUIRE_FALSE(HasHypotSq<Point3D<Meters>>);
    STATIC_REQUIRE_FALSE(HasBounds<Point2D<Meters>>);

    const Point2D<Meters> a{Meters{1}, Meters{2}};
    const Point2D<Meters> b{Meters{3}, Meters{4}};

    REQUIRE(a + b == Point2D<Meters>{Meters{4}, Meters{6}});
    REQUIRE(b - a == Point2D<Meters>{Meters{2}, Meters{2}});
    REQUIRE(-a == Point2D<Meters>{Meters{-1}, Meters{-2}});
    REQUIRE(a + (-a) == Point2D<Meters>{});

    Point3D<Meters> c{a, Meters{5}};
    c += Point3D<Meters>{b, Meters{1}};
    REQUIRE(c.x() == Meters{4});
    REQUIRE(c.z == Meters{6});
}

TEST_CASE("Points over a type with NumericTraits gain hypotSq and bounds", "[geometry][componentwise][capability]")
{
    STATIC_REQUIRE(core::CheckedArithmetic<Ticks>);
    STATIC_REQUIRE(HasHypotSq<Point2D<Ticks>>);
    STATIC_REQUIRE(HasBounds<Point3D<Ticks>>);

    const Point2D<Ticks> small{Ticks{3}, Ticks{4}};
    REQUIRE(small.hypotSq().value() == Ticks{25});

    const Point2D<Ticks> large{Ticks{200}, Ticks{1}};
    const auto overflow = large.hypotSq();
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().code() == core::ErrorCode::kArithmeticOverflow);

    REQUIRE(Point3D<Ticks>::maxValue().z == Ticks{32767});
    REQUIRE(Point2D<Ticks>::minValue().x == Ticks{-32768});
}
