#include "core/geometry.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace kerf::cam;
using kerf::cam::test::rectangle;

TEST(PolygonTest, AreaAndOrientation) {
    Polygon square = rectangle(0, 0, 4, 2);

    EXPECT_TRUE(square.isClosed());
    EXPECT_DOUBLE_EQ(square.area(), 8.0);
    EXPECT_DOUBLE_EQ(square.signedArea(), 8.0);
    EXPECT_FALSE(square.isClockwise());

    square.reverse();
    EXPECT_DOUBLE_EQ(square.signedArea(), -8.0);
    EXPECT_TRUE(square.isClockwise());
    EXPECT_DOUBLE_EQ(square.length(), 12.0);
}

TEST(PolygonTest, CloseAddsFirstPointOnce) {
    Polygon polygon;
    polygon.addPoint(Point2D(0, 0));
    polygon.addPoint(Point2D(1, 0));
    polygon.addPoint(Point2D(1, 1));
    EXPECT_FALSE(polygon.isClosed());

    polygon.close();
    polygon.close();
    EXPECT_EQ(polygon.size(), 4u);
    EXPECT_EQ(polygon.getPoints().back(), Point2D(0, 0));
}

TEST(PolygonTest, Bounds) {
    Polygon square = rectangle(-1, -2, 3, 4);

    double minX, minY, maxX, maxY;
    square.getBounds(minX, minY, maxX, maxY);
    EXPECT_DOUBLE_EQ(minX, -1.0);
    EXPECT_DOUBLE_EQ(minY, -2.0);
    EXPECT_DOUBLE_EQ(maxX, 3.0);
    EXPECT_DOUBLE_EQ(maxY, 4.0);
}

TEST(PolygonTest, NearestPointLiesOnAnEdge) {
    Polygon square = rectangle(0, 0, 10, 10);

    size_t segment = 99;
    Point2D nearest = square.nearestPoint(Point2D(4, -3), segment);
    EXPECT_EQ(nearest, Point2D(4, 0));
    EXPECT_EQ(segment, 0u);

    nearest = square.nearestPoint(Point2D(12, 7), segment);
    EXPECT_EQ(nearest, Point2D(10, 7));
    EXPECT_EQ(segment, 1u);
}

TEST(PolygonTest, RotatedToStartKeepsTheLoop) {
    Polygon square = rectangle(0, 0, 10, 10);
    Polygon rotated = square.rotatedToStart(Point2D(10, 7), 1);

    ASSERT_EQ(rotated.size(), 6u);
    EXPECT_EQ(rotated.getPoint(0), Point2D(10, 7));
    EXPECT_EQ(rotated.getPoint(1), Point2D(10, 10));
    EXPECT_EQ(rotated.getPoint(2), Point2D(0, 10));
    EXPECT_EQ(rotated.getPoint(3), Point2D(0, 0));
    EXPECT_EQ(rotated.getPoint(4), Point2D(10, 0));
    EXPECT_EQ(rotated.getPoint(5), Point2D(10, 7));
    EXPECT_DOUBLE_EQ(rotated.area(), square.area());
}

TEST(PathFaceTest, FromLoopsSplitsOuterAndHoles) {
    std::vector<std::vector<Point3D>> loops = {
        {Point3D(0, 0, -2), Point3D(10, 0, -2), Point3D(10, 10, -2), Point3D(0, 10, -2)},
        {Point3D(4, 4, -2), Point3D(4, 6, -2), Point3D(6, 6, -2), Point3D(6, 4, -2)},
    };

    PathFace face = PathFace::fromLoops(loops);
    EXPECT_DOUBLE_EQ(face.depth, -2.0);
    EXPECT_TRUE(face.outer.isClosed());
    EXPECT_DOUBLE_EQ(face.outer.area(), 100.0);
    ASSERT_EQ(face.inners.size(), 1u);
    EXPECT_DOUBLE_EQ(face.inners[0].area(), 4.0);
}

TEST(PathFaceTest, FromLoopsRejectsInvalidFaces) {
    std::vector<std::vector<Point3D>> tilted = {
        {Point3D(0, 0, -1), Point3D(10, 0, -1), Point3D(10, 10, -2)},
    };
    EXPECT_THROW(PathFace::fromLoops(tilted), std::invalid_argument);

    std::vector<std::vector<Point3D>> above = {
        {Point3D(0, 0, 1), Point3D(10, 0, 1), Point3D(10, 10, 1)},
    };
    EXPECT_THROW(PathFace::fromLoops(above), std::invalid_argument);

    std::vector<std::vector<Point3D>> tooShort = {
        {Point3D(0, 0, -1), Point3D(10, 0, -1)},
    };
    EXPECT_THROW(PathFace::fromLoops(tooShort), std::invalid_argument);
}
