#include <gtest/gtest.h>
#include "render/layout_engine.hpp"

using namespace ag;

// ==========================================
// Layout Type Tests
// ==========================================

TEST(LayoutTypeTest, ParseAndFormat) {
    EXPECT_EQ(layout_type_from_string("spring"), LayoutType::SPRING);
    EXPECT_EQ(layout_type_from_string("circular"), LayoutType::CIRCULAR);
    EXPECT_EQ(layout_type_from_string("grid"), LayoutType::GRID);
    EXPECT_EQ(layout_type_to_string(LayoutType::GRID), "grid");
    EXPECT_THROW(layout_type_from_string("force"), std::invalid_argument);
}

// ==========================================
// Circular Layout Tests
// ==========================================

TEST(CircularLayoutTest, FourPoints) {
    auto points = circular_layout_2d(4);
    ASSERT_EQ(points.size(), 4u);
    EXPECT_NEAR(points[0].x, 1.0, 1e-12);
    EXPECT_NEAR(points[0].y, 0.0, 1e-12);
    EXPECT_NEAR(points[1].x, 0.0, 1e-12);
    EXPECT_NEAR(points[1].y, 1.0, 1e-12);
    EXPECT_NEAR(points[2].x, -1.0, 1e-12);
    EXPECT_NEAR(points[3].y, -1.0, 1e-12);
}

TEST(CircularLayoutTest, EmptyAndSingle) {
    EXPECT_TRUE(circular_layout_2d(0).empty());
    auto single = circular_layout_3d(1);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_DOUBLE_EQ(single[0].x, 1.0);
    EXPECT_DOUBLE_EQ(single[0].z, 0.0);
}

TEST(CircularLayoutTest, ThreeDimensionalLiesInPlane) {
    auto flat = circular_layout_2d(7);
    auto points = circular_layout_3d(7);
    ASSERT_EQ(points.size(), 7u);
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_DOUBLE_EQ(points[i].x, flat[i].x);
        EXPECT_DOUBLE_EQ(points[i].y, flat[i].y);
        EXPECT_DOUBLE_EQ(points[i].z, 0.0);
    }
}

TEST(CircularLayoutTest, KeyedVariant) {
    auto layout = create_circular_layout({"B", "A"});
    ASSERT_EQ(layout.size(), 2u);
    EXPECT_NEAR(layout["B"].x, 1.0, 1e-12);
    EXPECT_NEAR(layout["A"].x, -1.0, 1e-12);
}

// ==========================================
// Grid Layout Tests
// ==========================================

TEST(GridLayoutTest, FivePointsUseThreeColumns) {
    auto points = grid_layout(5);
    ASSERT_EQ(points.size(), 5u);
    EXPECT_DOUBLE_EQ(points[2].x, 2.0);
    EXPECT_DOUBLE_EQ(points[2].y, 0.0);
    EXPECT_DOUBLE_EQ(points[3].x, 0.0);
    EXPECT_DOUBLE_EQ(points[3].y, 1.0);
    EXPECT_DOUBLE_EQ(points[4].x, 1.0);
}

TEST(GridLayoutTest, PerfectSquare) {
    auto points = grid_layout(4);
    EXPECT_DOUBLE_EQ(points[1].x, 1.0);
    EXPECT_DOUBLE_EQ(points[2].x, 0.0);
    EXPECT_DOUBLE_EQ(points[2].y, 1.0);
}

TEST(GridLayoutTest, Empty) {
    EXPECT_TRUE(grid_layout(0).empty());
    EXPECT_TRUE(create_grid_layout({}).empty());
}

// ==========================================
// Spring Layout Tests
// ==========================================

TEST(SpringLayoutTest, ProjectsThreeDimensionalPositions) {
    std::map<std::string, Point3D> positions{{"A", {1.0, 2.0, 3.0}}, {"B", {-1.0, 0.5, 9.0}}};
    auto layout = create_spring_layout_2d(positions, {"A", "B", "MISSING"});

    ASSERT_EQ(layout.size(), 2u);
    EXPECT_DOUBLE_EQ(layout["A"].x, 1.0);
    EXPECT_DOUBLE_EQ(layout["A"].y, 2.0);
    EXPECT_DOUBLE_EQ(layout["B"].y, 0.5);
    EXPECT_EQ(layout.count("MISSING"), 0u);
}

TEST(SpringLayoutTest, EmptyInputs) {
    EXPECT_TRUE(create_spring_layout_2d({}, {"A"}).empty());
    EXPECT_TRUE(create_spring_layout_2d({{"A", {1.0, 1.0, 1.0}}}, {}).empty());
}

TEST(SpringLayoutTest, Deterministic) {
    std::map<std::string, Point3D> positions{{"A", {0.3, 0.4, 0.0}}};
    auto first = create_spring_layout_2d(positions, {"A"});
    auto second = create_spring_layout_2d(positions, {"A"});
    EXPECT_DOUBLE_EQ(first["A"].x, second["A"].x);
    EXPECT_DOUBLE_EQ(first["A"].y, second["A"].y);
}
