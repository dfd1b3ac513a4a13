#include "kerf-cam/utils.h"
#include <gtest/gtest.h>
#include <fstream>

using namespace kerf::cam;

namespace {

std::string writeTempFile(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path);
    file << contents;
    return path;
}

} // namespace

TEST(UtilsTest, FormatNumber) {
    EXPECT_EQ(Utils::formatNumber(1.5), "1.5");
    EXPECT_EQ(Utils::formatNumber(2.0), "2");
    EXPECT_EQ(Utils::formatNumber(-0.0001), "0");
    EXPECT_EQ(Utils::formatNumber(1.23456), "1.235");
    EXPECT_EQ(Utils::formatNumber(1.23456, 1), "1.2");
    EXPECT_EQ(Utils::formatNumber(10.0, 0), "10");
    EXPECT_EQ(Utils::formatNumber(-2.5), "-2.5");
}

TEST(UtilsTest, LoadFacesFromCSV) {
    std::string path = writeTempFile("kerf_cam_faces.csv",
        "# kind,face,loop,x,y,z\n"
        "op,0,0,0,0,-2\n"
        "op,0,0,10,0,-2\n"
        "op,0,0,10,10,-2\n"
        "op,0,0,0,10,-2\n"
        "op,0,1,4,4,-2\n"
        "op,0,1,4,6,-2\n"
        "op,0,1,6,6,-2\n"
        "op,0,1,6,4,-2\n"
        "\n"
        "avoid,0,0,1,1,0\n"
        "avoid,0,0,2,1,0\n"
        "avoid,0,0,2,2,0\n");

    std::vector<PathFace> opFaces;
    std::vector<PathFace> avoidFaces;
    ASSERT_TRUE(Utils::loadFacesFromCSV(path, opFaces, avoidFaces));

    ASSERT_EQ(opFaces.size(), 1u);
    EXPECT_DOUBLE_EQ(opFaces[0].depth, -2.0);
    EXPECT_NEAR(opFaces[0].outer.area(), 100.0, 1e-9);
    ASSERT_EQ(opFaces[0].inners.size(), 1u);
    EXPECT_NEAR(opFaces[0].inners[0].area(), 4.0, 1e-9);

    ASSERT_EQ(avoidFaces.size(), 1u);
    EXPECT_DOUBLE_EQ(avoidFaces[0].depth, 0.0);
}

TEST(UtilsTest, LoadFacesRejectsBadRows) {
    std::vector<PathFace> opFaces;
    std::vector<PathFace> avoidFaces;

    std::string wrongFields = writeTempFile("kerf_cam_faces_fields.csv", "op,0,0,1,2\n");
    EXPECT_FALSE(Utils::loadFacesFromCSV(wrongFields, opFaces, avoidFaces));

    std::string wrongKind = writeTempFile("kerf_cam_faces_kind.csv", "keep,0,0,1,2,0\n");
    EXPECT_FALSE(Utils::loadFacesFromCSV(wrongKind, opFaces, avoidFaces));

    std::string badNumber = writeTempFile("kerf_cam_faces_number.csv", "op,0,0,one,2,0\n");
    EXPECT_FALSE(Utils::loadFacesFromCSV(badNumber, opFaces, avoidFaces));

    std::string notFlat = writeTempFile("kerf_cam_faces_flat.csv",
        "op,0,0,0,0,-1\nop,0,0,1,0,-1\nop,0,0,1,1,-2\n");
    EXPECT_FALSE(Utils::loadFacesFromCSV(notFlat, opFaces, avoidFaces));

    EXPECT_FALSE(Utils::loadFacesFromCSV(::testing::TempDir() + "kerf_cam_missing.csv", opFaces, avoidFaces));
}

TEST(UtilsTest, FileNames) {
    EXPECT_EQ(Utils::getFileExtension("parts/lid.csv"), "csv");
    EXPECT_EQ(Utils::getFileExtension("Makefile"), "");
    EXPECT_EQ(Utils::getBaseName("parts/lid.csv"), "lid");
    EXPECT_EQ(Utils::replaceExtension("parts/lid.csv", "nc"), "parts/lid.nc");
    EXPECT_EQ(Utils::replaceExtension("lid", "nc"), "lid.nc");
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(Utils::trim("   "), "");
}
