/**
 * @file TestPoint3D.cpp
 * @brief Unit tests for pts::geometry::Point3D.
 */

#include <catch2/catch.hpp>

#include <pts/geometry/Point3D.hpp>

#include <array>
#include <limits>
#include <tuple>
#include <unordered_map>

using namespace pts;
using namespace pts::geometry;

TEST_CASE("Point3D adds componentwise", "[geometry][point3d]")
{
    const Point3D p1{std::array{1, 2, 3}};
    const Point3D p2{std::array{3, 4, 5}};

    REQUIRE(p1 + p2 == Point3D{4, 6, 8});
    REQUIRE(p1 + p2 == p2 + p1);

    Point3D p3 = p1;
    p3 += p2;
    REQUIRE(p3 == Point3D{4, 6, 8});
}

TEST_CASE("Point3D subtracts componentwise", "[geometry][point3d]")
{
    const Point3D p1{1, 2, 3};
    Point3D p2{3, 4, 5};

    REQUIRE(p2 - p1 == Point3D{2, 2, 2});

    p2 -= p1;
    REQUIRE(p2 == Point3D{2, 2, 2});
}

TEST_CASE("Point3D negation and additive inverse", "[geometry][point3d]")
{
    const Point3D p{1, -2, 0};

    REQUIRE(-p == Point3D{-1, 2, 0});
    REQUIRE(p + (-p) == Point3D<int>{});
}

TEST_CASE("Point3D equality compares every coordinate", "[geometry][point3d]")
{
    const Point3D p1{1, 2, 3};

    REQUIRE(p1 == Point3D{1, 2, 3});
    REQUIRE(p1 != Point3D{3, 4, 5});
    REQUIRE(p1 != Point3D{1, 2, 4});
    REQUIRE(p1 != Point3D{0, 2, 3});
}

TEST_CASE("Point3D x() and y() alias the embedded Point2D", "[geometry][point3d][delegation]")
{
    Point3D p{1, -2, 3};

    REQUIRE(p.x() == 1);
    REQUIRE(p.y() == -2);
    REQUIRE(p.z == 3);

    p.x() = 10;
    REQUIRE(p.xy.x == 10);

    p.xy.y = 20;
    REQUIRE(p.y() == 20);

    p.x() += 5;
    REQUIRE(p.xy == Point2D{15, 20});
    REQUIRE(&p.x() == &p.xy.x);

    const Point3D<int> &view = p;
    REQUIRE(&view.y() == &p.xy.y);
}

TEST_CASE("Point3D builds from a Point2D and z", "[geometry][point3d]")
{
    const Point3D p{Point2D{1, 2}, 3};

    REQUIRE(p == Point3D{1, 2, 3});
    REQUIRE(p.xy == Point2D{1, 2});
}

TEST_CASE("Point3D converts from and to arrays", "[geometry][point3d][conversion]")
{
    const std::array arr{1, -2, 3};
    const Point3D p{arr};

    REQUIRE(p == Point3D<int>::fromArray(arr));
    REQUIRE(p.toArray() == arr);
    REQUIRE(static_cast<std::array<int, 3>>(p) == arr);
    REQUIRE(Point3D<int>::fromArray(p.toArray()) == p);

    const Point3D built{Point2D{std::array{1, -2}}, 3};
    REQUIRE(built.toArray() == arr);
}

TEST_CASE("Point3D converts from and to tuples", "[geometry][point3d][conversion]")
{
    const std::tuple tup{1, -2, 3};
    const Point3D p{tup};

    REQUIRE(p == Point3D{1, -2, 3});
    REQUIRE(p.toTuple() == tup);
    REQUIRE(static_cast<std::tuple<int, int, int>>(p) == tup);
    REQUIRE(Point3D<int>::fromTuple(p.toTuple()) == p);
}

TEST_CASE("Point3D supports structured bindings", "[geometry][point3d][conversion]")
{
    Point3D p{4, 5, 6};

    const auto [x, y, z] = p;
    REQUIRE(x == 4);
    REQUIRE(y == 5);
    REQUIRE(z == 6);

    auto &[rx, ry, rz] = p;
    ry = 50;
    rz = 60;
    REQUIRE(p.xy.y == 50);
    REQUIRE(p.z == 60);
    REQUIRE(rx == 4);
}

TEST_CASE("Point3D equal values hash equally", "[geometry][point3d][hash]")
{
    const std::hash<Point3Di> hasher;
    const Point3Di a{1, 2, 3};
    const Point3Di b = Point3Di{0, 0, 0} + a;

    REQUIRE(hasher(a) == hasher(b));
    REQUIRE(hasher(a) != hasher(Point3Di{3, 2, 1}));

    std::unordered_map<Point3Di, int> counts;
    ++counts[a];
    ++counts[b];
    REQUIRE(counts.size() == 1);
    REQUIRE(counts[a] == 2);
}

TEST_CASE("Point3D bounds come from the coordinate type", "[geometry][point3d][bounds]")
{
    constexpr auto kMin = std::numeric_limits<core::i16>::min();
    constexpr auto kMax = std::numeric_limits<core::f32>::max();

    REQUIRE(Point3D<core::i16>::minValue() == Point3D<core::i16>{kMin, kMin, kMin});
    REQUIRE(Point3D<core::f32>::maxValue() == Point3D{kMax, kMax, kMax});
}

TEST_CASE("Point3D hypotSq sums three squares", "[geometry][point3d][hypot]")
{
    const auto result = Point3D{1, 2, 2}.hypotSq();

    REQUIRE(result.has_value());
    REQUIRE(*result == 9);
    REQUIRE(Point3D<core::i64>{2, 3, 6}.hypotSq().value() == 49);
}

TEST_CASE("Point3D hypotSq stops at the first overflow", "[geometry][point3d][hypot]")
{
    const auto mulOverflow = Point3D<core::i8>{1, 1, 12}.hypotSq();
    REQUIRE_FALSE(mulOverflow.has_value());
    REQUIRE(mulOverflow.error().code() == core::ErrorCode::kArithmeticOverflow);
    REQUIRE(mulOverflow.error().message() == "checked multiply overflowed on coordinate z");

    const auto addOverflow = Point3D<core::i8>{5, 5, 10}.hypotSq();
    REQUIRE_FALSE(addOverflow.has_value());
    REQUIRE(addOverflow.error().message() == "checked add overflowed on coordinate z");

    const auto early = Point3D<core::i8>{12, 1, 1}.hypotSq();
    REQUIRE_FALSE(early.has_value());
    REQUIRE(early.error().message() == "checked multiply overflowed on coordinate x");
}

TEST_CASE("Point3D formats as ( x, y, z )", "[geometry][point3d][format]")
{
    REQUIRE(toString(Point3D{std::array{1, -2, 0}}) == "( 1, -2, 0 )");
    REQUIRE(toString(Point3D<core::u8>{0, 128, 255}) == "( 0, 128, 255 )");
}
