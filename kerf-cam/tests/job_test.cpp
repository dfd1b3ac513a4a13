#include "core/job.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace kerf::cam;
using kerf::cam::test::face;
using kerf::cam::test::square;

namespace {

JobSettings pocketSettings() {
    JobSettings settings;
    settings.feed = 300.0;
    settings.toolDiameter = 1.0;
    return settings;
}

std::vector<PathFace> squarePocket() {
    return {face(square(0, 0, 5), -1.0)};
}

} // namespace

TEST(JobTest, EmptyJobHasHeaderAndFooter) {
    Job job;

    EXPECT_EQ(job.toGcode(),
              "(Job - Feedrate: 0 - Unit: METRIC)\n"
              "G90\n"
              "G21\n"
              "\n"
              "G1Z0\n"
              "G0Z10\n"
              "X0Y0");
}

TEST(JobTest, ImperialHeaderAndFooter) {
    JobSettings settings;
    settings.name = "Sign";
    settings.feed = 40.0;
    settings.unit = Unit::Imperial;

    std::string gcode = Job(settings).toGcode();

    EXPECT_EQ(gcode.find("(Sign - Feedrate: 40 - Unit: IMPERIAL)\nG90\nG20\n"), 0u);
    EXPECT_NE(gcode.find("G0Z0.4\nX0Y0"), std::string::npos);
}

TEST(JobTest, OperationsAreAppendedToCopies) {
    Job job(pocketSettings());
    Job pocketed = job.pocket(squarePocket());

    EXPECT_TRUE(job.getOperations().empty());
    ASSERT_EQ(pocketed.getOperations().size(), 1u);
    EXPECT_EQ(pocketed.getOperations()[0]->getName(), "Pocket");

    Job twice = pocketed.pocket(squarePocket());
    ASSERT_EQ(twice.getOperations().size(), 2u);
    EXPECT_EQ(pocketed.getOperations().size(), 1u);
    // Earlier operations are shared, not copied
    EXPECT_EQ(twice.getOperations()[0], pocketed.getOperations()[0]);
}

TEST(JobTest, PocketBlockStartsWithRetract) {
    Job job = Job(pocketSettings()).pocket(squarePocket());
    std::string gcode = job.toGcode();

    EXPECT_NE(gcode.find("(Job - Pocket)\nG0Z10\n"), std::string::npos);
}

TEST(JobTest, OperationsAreSeparatedByBlankLines) {
    Job job = Job(pocketSettings()).pocket(squarePocket()).pocket(squarePocket());
    std::string gcode = job.toGcode();

    EXPECT_NE(gcode.find("\n\n\n(Job - Pocket)"), std::string::npos);
}

TEST(JobTest, ToolChangeOperation) {
    Job job = Job(pocketSettings()).pocket(squarePocket(), {}, PocketParams(), Tool(1.0, 1));

    ASSERT_EQ(job.getOperations().size(), 2u);
    EXPECT_EQ(job.getOperations()[0]->toGcode(job.getSettings()),
              "(Job - Tool Change)\nM5\nG30\nM1\nT1 G43 H1 M6\nM3");
    EXPECT_EQ(job.getSettings().toolNumber, 1);

    // Same tool again, no change
    Job again = job.pocket(squarePocket(), {}, PocketParams(), Tool(1.0, 1));
    EXPECT_EQ(again.getOperations().size(), 3u);
}

TEST(JobTest, SpeedChangeOperation) {
    Job job = Job(pocketSettings()).pocket(squarePocket(), {}, PocketParams(),
                                           Tool(std::nullopt, std::nullopt, std::nullopt, 1000));

    ASSERT_EQ(job.getOperations().size(), 2u);
    EXPECT_EQ(job.getOperations()[0]->toGcode(job.getSettings()), "(Job - Speed Change)\nM3 S1000");
    EXPECT_EQ(job.getSettings().speed, 1000);
}

TEST(JobTest, ToolDiameterChangesToolpath) {
    Job base(pocketSettings());
    Job job = base.pocket(squarePocket())
                  .pocket(squarePocket(), {}, PocketParams(), Tool(1.0))
                  .pocket(squarePocket(), {}, PocketParams(), Tool(2.0));

    const auto& operations = job.getOperations();
    ASSERT_EQ(operations.size(), 3u);
    EXPECT_EQ(operations[0]->getCommands(), operations[1]->getCommands());
    EXPECT_NE(operations[1]->getCommands(), operations[2]->getCommands());
    EXPECT_DOUBLE_EQ(*job.getSettings().toolDiameter, 2.0);
}

TEST(JobTest, ToolFeedIsUsed) {
    Job job = Job(pocketSettings()).pocket(squarePocket(), {}, PocketParams(),
                                           Tool(std::nullopt, std::nullopt, 150.0));

    EXPECT_DOUBLE_EQ(job.getSettings().feed, 150.0);
    EXPECT_NE(job.toGcode().find("F150"), std::string::npos);
}

TEST(JobTest, Errors) {
    Job noTool;
    EXPECT_THROW(noTool.pocket(squarePocket()), std::invalid_argument);
    EXPECT_THROW(noTool.profile(squarePocket()), std::invalid_argument);

    Job job(pocketSettings());
    EXPECT_THROW(job.pocket(squarePocket(), {}, PocketParams(), Tool(-1.0)), std::invalid_argument);
}

TEST(JobTest, PocketTooSmallForToolIsEmptyOperation) {
    PocketResult diagnostics;
    Job job = Job(pocketSettings()).pocket({face(square(0, 0, 0.8), -1.0)}, {}, PocketParams(),
                                           std::nullopt, &diagnostics);

    EXPECT_TRUE(diagnostics.hasWarnings());
    ASSERT_EQ(job.getOperations().size(), 1u);
    EXPECT_EQ(job.getOperations()[0]->getName(), "Pocket");
    EXPECT_TRUE(job.getOperations()[0]->getCommands().empty());
}

TEST(JobTest, ProfileAndWireProfileNames) {
    Wire wire;
    wire.addEdge(Edge::line(Point3D(0, 0, -1), Point3D(5, 0, -1)));

    Job job = Job(pocketSettings()).profile(squarePocket()).wireProfile({wire});

    ASSERT_EQ(job.getOperations().size(), 2u);
    EXPECT_EQ(job.getOperations()[0]->getName(), "Profile");
    EXPECT_EQ(job.getOperations()[1]->getName(), "Wire Profile");
}

TEST(OperationTest, MovesThatGoNowhereAreSkipped) {
    JobSettings settings;
    Operation operation("Test", {}, {
        Command::abs(CommandKind::Cut, 1.0, 0.0, -1.0),
        Command::abs(CommandKind::Rapid, 1.0, 0.0),
        Command::abs(CommandKind::Cut, 2.0, 0.0, -1.0),
    });

    // The skipped rapid leaves G1 modal
    EXPECT_EQ(operation.toGcode(settings), "(Job - Test)\nG1X1Z-1\nX2");
}

TEST(OperationTest, ConfigCommandsComeFirst) {
    JobSettings settings;
    Operation operation("Start", {ConfigCommand::safetyBlock(Unit::Metric)},
                        {Command::retract(10.0)});

    EXPECT_EQ(operation.toGcode(settings),
              "(Job - Start)\nG90 G54 G64 G50 G17 G94\nG49 G40 G80\nG21\nG30\nG0Z10");
}

TEST(JobTest, SaveGcodeWritesProgram) {
    Job job = Job(pocketSettings()).pocket(squarePocket());
    std::string path = ::testing::TempDir() + "kerf_cam_job_test.nc";

    ASSERT_TRUE(job.saveGcode(path));

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str(), job.toGcode());
}

TEST(JobTest, SaveGcodeFailsForBadPath) {
    Job job;
    EXPECT_FALSE(job.saveGcode("/nonexistent-directory/out.nc"));
}

TEST(JobSettingsTest, HeightDefaultsPerUnit) {
    JobSettings settings;
    EXPECT_DOUBLE_EQ(settings.getRapidHeight(), 10.0);
    EXPECT_DOUBLE_EQ(settings.getOpSafeHeight(), 1.0);

    settings.unit = Unit::Imperial;
    EXPECT_DOUBLE_EQ(settings.getRapidHeight(), 0.4);
    EXPECT_DOUBLE_EQ(settings.getOpSafeHeight(), 0.04);

    settings.rapidHeight = 2.0;
    EXPECT_DOUBLE_EQ(settings.getRapidHeight(), 2.0);
}

TEST(JobSettingsTest, PlungeFeedFallsBackToFeed) {
    JobSettings settings;
    settings.feed = 500.0;
    EXPECT_DOUBLE_EQ(settings.getPlungeFeed(), 500.0);

    settings.plungeFeed = 100.0;
    EXPECT_DOUBLE_EQ(settings.getPlungeFeed(), 100.0);
}
