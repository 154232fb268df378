#include <gtest/gtest.h>
#include <puttcraft/core/Shape.h>
#include <puttcraft/core/GeometryUtils.h>

using namespace puttcraft;

// ============== Rectangle ==============

TEST(ShapeTest, RectContainmentIsEdgeInclusive) {
    Rect rect{10, 20, 100, 50};

    EXPECT_TRUE(geometry::pointInRect({10, 20}, rect));
    EXPECT_TRUE(geometry::pointInRect({110, 70}, rect));
    EXPECT_TRUE(geometry::pointInRect({60, 45}, rect));
    EXPECT_FALSE(geometry::pointInRect({9.9f, 45}, rect));
    EXPECT_FALSE(geometry::pointInRect({60, 70.1f}, rect));
}

TEST(ShapeTest, DistanceToRectEdge) {
    Rect fairway{0, 0, 800, 600};

    EXPECT_FLOAT_EQ(geometry::distanceToRectEdge({400, 300}, fairway), 300.0f);
    EXPECT_FLOAT_EQ(geometry::distanceToRectEdge({790, 300}, fairway), 10.0f);
    EXPECT_LT(geometry::distanceToRectEdge({-5, 300}, fairway), 0.0f);
}

// ============== Polygon ==============

TEST(ShapeTest, PolygonRayCasting) {
    std::vector<Point> triangle = {{0, 0}, {100, 0}, {0, 100}};

    EXPECT_TRUE(geometry::pointInPolygon({10, 10}, triangle));
    EXPECT_TRUE(geometry::pointInPolygon({40, 40}, triangle));
    EXPECT_FALSE(geometry::pointInPolygon({60, 60}, triangle));
    EXPECT_FALSE(geometry::pointInPolygon({-1, 10}, triangle));
}

TEST(ShapeTest, ConcavePolygonUsesEvenOddRule) {
    // U shape open at the top: notch spans x in (40, 60), y < 80
    std::vector<Point> u = {{0, 0}, {40, 0}, {40, 80}, {60, 80}, {60, 0},
                            {100, 0}, {100, 100}, {0, 100}};

    EXPECT_TRUE(geometry::pointInPolygon({20, 50}, u));
    EXPECT_TRUE(geometry::pointInPolygon({80, 50}, u));
    EXPECT_FALSE(geometry::pointInPolygon({50, 40}, u));
    EXPECT_TRUE(geometry::pointInPolygon({50, 90}, u));
}

TEST(ShapeTest, DegeneratePolygonNeverContains) {
    EXPECT_FALSE(geometry::pointInPolygon({0, 0}, {}));
    EXPECT_FALSE(geometry::pointInPolygon({5, 0}, {{0, 0}, {10, 0}}));

    Polygon line = Polygon::fromFlat({0, 0, 10, 10});
    EXPECT_TRUE(line.isDegenerate());
    EXPECT_FALSE(shapeContains(line, {5, 5}));
}

TEST(ShapeTest, PolygonFromFlatIgnoresTrailingCoordinate) {
    Polygon poly = Polygon::fromFlat({0, 0, 50, 0, 50, 50, 7});

    ASSERT_EQ(poly.vertices.size(), 3u);
    EXPECT_EQ(poly.vertices[2], Point(50, 50));
    EXPECT_FALSE(poly.isDegenerate());
}

// ============== Circle ==============

TEST(ShapeTest, CircleWithMargin) {
    Point center{100, 100};

    EXPECT_TRUE(geometry::pointInCircle({108, 100}, center, 8.0f));
    EXPECT_FALSE(geometry::pointInCircle({109, 100}, center, 8.0f));
    EXPECT_TRUE(geometry::pointInCircle({109, 100}, center, 8.0f, 8.0f));
    EXPECT_FALSE(geometry::pointInCircle({117, 100}, center, 8.0f, 8.0f));
}

// ============== Variant dispatch ==============

TEST(ShapeTest, ShapeContainsDispatchesOnVariant) {
    Shape rect = Rect{0, 0, 10, 10};
    Shape poly = Polygon({{20, 0}, {30, 0}, {30, 10}, {20, 10}});
    Shape circle = Circle({50, 5}, 5);

    EXPECT_TRUE(shapeContains(rect, {5, 5}));
    EXPECT_TRUE(shapeContains(poly, {25, 5}));
    EXPECT_TRUE(shapeContains(circle, {52, 5}));

    EXPECT_FALSE(shapeContains(rect, {25, 5}));
    EXPECT_FALSE(shapeContains(poly, {5, 5}));
    EXPECT_FALSE(shapeContains(circle, {25, 5}));
}

TEST(ShapeTest, AnyShapeContains) {
    std::vector<Shape> shapes = {Rect{0, 0, 10, 10}, Circle({100, 100}, 10)};

    EXPECT_TRUE(anyShapeContains(shapes, {95, 100}));
    EXPECT_TRUE(anyShapeContains(shapes, {0, 0}));
    EXPECT_FALSE(anyShapeContains(shapes, {50, 50}));
    EXPECT_FALSE(anyShapeContains({}, {0, 0}));
}
