#include "core/polygon_ops.h"
#include "test_helpers.h"
#include <gtest/gtest.h>

using namespace kerf::cam;
using kerf::cam::test::face;
using kerf::cam::test::rectangle;
using kerf::cam::test::square;

TEST(PolygonOpsTest, InwardOffsetShrinksSquare) {
    auto result = PolygonOps::offsetPolygon(square(0, 0, 10), -1.0);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_NEAR(result[0].area(), 64.0, 1e-6);

    double minX, minY, maxX, maxY;
    result[0].getBounds(minX, minY, maxX, maxY);
    EXPECT_NEAR(minX, -4.0, 1e-6);
    EXPECT_NEAR(maxX, 4.0, 1e-6);
}

TEST(PolygonOpsTest, OffsetIgnoresInputOrientation) {
    Polygon clockwise = square(0, 0, 10);
    clockwise.reverse();

    auto result = PolygonOps::offsetPolygon(clockwise, -1.0);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_NEAR(result[0].area(), 64.0, 1e-6);
    EXPECT_FALSE(result[0].isClockwise());
}

TEST(PolygonOpsTest, OutwardOffsetRoundsCorners) {
    auto result = PolygonOps::offsetPolygon(square(0, 0, 10), 1.0);

    ASSERT_EQ(result.size(), 1u);
    // 10x10 square plus four 10x1 strips plus a unit circle at the corners
    EXPECT_NEAR(result[0].area(), 100.0 + 40.0 + 3.14159265, 0.1);
}

TEST(PolygonOpsTest, OffsetOutAndBackDoesNotGrowArea) {
    Polygon ell;
    ell.addPoint(Point2D(0, 0));
    ell.addPoint(Point2D(6, 0));
    ell.addPoint(Point2D(6, 2));
    ell.addPoint(Point2D(2, 2));
    ell.addPoint(Point2D(2, 6));
    ell.addPoint(Point2D(0, 6));
    ell.close();

    for (const Polygon& original : {square(0, 0, 10), ell}) {
        for (double distance : {0.5, -0.5, 1.0, -0.75}) {
            double area = 0.0;
            for (const auto& there : PolygonOps::offsetPolygon(original, distance)) {
                for (const auto& back : PolygonOps::offsetPolygon(there, -distance)) {
                    area += back.area();
                }
            }
            EXPECT_LE(area, original.area() + 1e-2) << "distance " << distance;
        }
    }
}

TEST(PolygonOpsTest, OffsetPastCollapseIsEmpty) {
    EXPECT_TRUE(PolygonOps::offsetPolygon(square(0, 0, 2), -1.5).empty());
}

TEST(PolygonOpsTest, OffsetSplitsDumbbell) {
    // Two 4x4 squares joined by a 1 wide neck
    Polygon dumbbell;
    dumbbell.addPoint(Point2D(0, 0));
    dumbbell.addPoint(Point2D(4, 0));
    dumbbell.addPoint(Point2D(4, 1.5));
    dumbbell.addPoint(Point2D(6, 1.5));
    dumbbell.addPoint(Point2D(6, 0));
    dumbbell.addPoint(Point2D(10, 0));
    dumbbell.addPoint(Point2D(10, 4));
    dumbbell.addPoint(Point2D(6, 4));
    dumbbell.addPoint(Point2D(6, 2.5));
    dumbbell.addPoint(Point2D(4, 2.5));
    dumbbell.addPoint(Point2D(4, 4));
    dumbbell.addPoint(Point2D(0, 4));
    dumbbell.close();

    EXPECT_EQ(PolygonOps::offsetPolygon(dumbbell, -0.75).size(), 2u);
}

TEST(PolygonOpsTest, DifferenceBuildsHoles) {
    std::vector<Polygon> subjects = {square(0, 0, 10)};
    std::vector<Polygon> clips = {square(0, 0, 2)};

    auto forest = PolygonOps::booleanOp(subjects, clips, BooleanOp::DIFFERENCE);

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_NEAR(forest[0].outer.area(), 100.0, 1e-6);
    ASSERT_EQ(forest[0].holes.size(), 1u);
    EXPECT_NEAR(forest[0].holes[0].area(), 4.0, 1e-6);
}

TEST(PolygonOpsTest, UnionMergesOverlaps) {
    std::vector<Polygon> subjects = {rectangle(0, 0, 4, 4), rectangle(2, 0, 6, 4)};
    auto forest = PolygonOps::booleanOp(subjects, {}, BooleanOp::UNION);

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_NEAR(forest[0].outer.area(), 24.0, 1e-6);
    EXPECT_TRUE(forest[0].holes.empty());
}

TEST(PolygonOpsTest, IntersectionKeepsOverlap) {
    std::vector<Polygon> subjects = {rectangle(0, 0, 4, 4)};
    std::vector<Polygon> clips = {rectangle(2, 2, 6, 6)};
    auto forest = PolygonOps::booleanOp(subjects, clips, BooleanOp::INTERSECTION);

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_NEAR(forest[0].outer.area(), 4.0, 1e-6);
}

TEST(PolygonOpsTest, IslandsInsideHolesAreSeparateGroups) {
    // Ring with a block sitting in its hole, the hole wound clockwise
    Polygon hole = square(0, 0, 6);
    hole.reverse();
    std::vector<Polygon> subjects = {square(0, 0, 10), hole, square(0, 0, 2)};

    auto forest = PolygonOps::booleanOp(subjects, {}, BooleanOp::UNION);

    ASSERT_EQ(forest.size(), 2u);
    EXPECT_NEAR(forest[0].outer.area(), 100.0, 1e-6);
    ASSERT_EQ(forest[0].holes.size(), 1u);
    EXPECT_NEAR(forest[0].holes[0].area(), 36.0, 1e-6);
    EXPECT_NEAR(forest[1].outer.area(), 4.0, 1e-6);
    EXPECT_TRUE(forest[1].holes.empty());
}

TEST(PolygonOpsTest, OffsetFaceRebuildsHoles) {
    // 10x10 face with a 2x2 hole, shrink the outer by 1 and grow the hole by 2
    PathFace face(square(0, 0, 10), {square(0, 0, 2)}, -5.0);

    auto faces = PolygonOps::offsetFace(face, -1.0, 2.0);

    ASSERT_EQ(faces.size(), 1u);
    EXPECT_DOUBLE_EQ(faces[0].depth, -5.0);
    EXPECT_NEAR(faces[0].outer.area(), 64.0, 1e-6);
    ASSERT_EQ(faces[0].inners.size(), 1u);

    double minX, minY, maxX, maxY;
    faces[0].inners[0].getBounds(minX, minY, maxX, maxY);
    EXPECT_NEAR(minX, -3.0, 1e-6);
    EXPECT_NEAR(maxY, 3.0, 1e-6);
}

TEST(PolygonOpsTest, OffsetFaceSwallowedByHole) {
    PathFace face(square(0, 0, 10), {square(0, 0, 6)}, -1.0);
    EXPECT_TRUE(PolygonOps::offsetFace(face, -1.0, 2.0).empty());
}

TEST(PolygonOpsTest, PolygonInsideFace) {
    PathFace block = face(square(0, 0, 10), -1.0);
    EXPECT_TRUE(PolygonOps::isPolygonInsideFace(square(0, 0, 2), block));
    EXPECT_TRUE(PolygonOps::isPolygonInsideFace(square(0, 0, 10), block));
    EXPECT_FALSE(PolygonOps::isPolygonInsideFace(square(0, 0, 12), block));
    EXPECT_FALSE(PolygonOps::isPolygonInsideFace(square(20, 0, 2), block));
    EXPECT_FALSE(PolygonOps::isPolygonInsideFace(square(5, 0, 2), block));
}

TEST(PolygonOpsTest, PolygonInHoleIsNotInsideFace) {
    Polygon hole = square(0, 0, 10);
    hole.reverse();
    PathFace ring = face(square(0, 0, 20), -1.0, {hole});

    EXPECT_FALSE(PolygonOps::isPolygonInsideFace(square(0, 0, 4), ring));
    EXPECT_FALSE(PolygonOps::isPolygonInsideFace(square(5, 0, 2), ring));
    EXPECT_TRUE(PolygonOps::isPolygonInsideFace(rectangle(6, -2, 9, 2), ring));
}
