#include "core/command.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace kerf::cam;

TEST(CommandTest, LinearCut) {
    Command cut = Command::abs(CommandKind::Cut, 10, 5, 1);

    auto gcode = cut.toGcode(nullptr, Point3D(0, 0, 0), 3);
    EXPECT_EQ(gcode.first, "G1X10Y5Z1");
    EXPECT_EQ(gcode.second, Point3D(10, 5, 1));
}

TEST(CommandTest, LinearCutWithFeed) {
    Command cut = Command::abs(CommandKind::Cut, 10, 5, 1).withFeed(200);
    EXPECT_EQ(cut.toGcode(nullptr, Point3D(0, 0, 0), 3).first, "G1X10Y5Z1F200");
}

TEST(CommandTest, ClockwiseArc) {
    Command arc = Command::arc(CommandKind::CircularCW,
                               CommandVector(1, 0, std::nullopt),
                               CommandVector(0, 0, std::nullopt),
                               CommandVector(0, 1, std::nullopt));

    auto gcode = arc.toGcode(nullptr, Point3D(-1, 0, 0), 3);
    EXPECT_EQ(gcode.first, "G2X1I1J0");
    EXPECT_EQ(gcode.second, Point3D(1, 0, 0));
}

TEST(CommandTest, CounterClockwiseArc) {
    Command arc = Command::arc(CommandKind::CircularCCW,
                               CommandVector(1, 0, std::nullopt),
                               CommandVector(0, 0, std::nullopt),
                               CommandVector(0, -1, std::nullopt));

    EXPECT_EQ(arc.toGcode(nullptr, Point3D(-1, 0, 0), 3).first, "G3X1I1J0");
}

TEST(CommandTest, ModalWordOnlyWhenItChanges) {
    Command first = Command::abs(CommandKind::Cut, 1, 0, 0);
    Command second = Command::abs(CommandKind::Cut, 2, 0, 0);
    Command rapid = Command::abs(CommandKind::Rapid, 5, 5);

    auto line1 = first.toGcode(nullptr, Point3D(0, 0, 0), 3);
    auto line2 = second.toGcode(&first, line1.second, 3);
    auto line3 = rapid.toGcode(&second, line2.second, 3);

    EXPECT_EQ(line1.first, "G1X1");
    EXPECT_EQ(line2.first, "X2");
    EXPECT_EQ(line3.first, "G0X5Y5");
}

TEST(CommandTest, PlungeAndRetractShareCutAndRapidWords) {
    EXPECT_STREQ(Command::plunge(-1).modal(), "G1");
    EXPECT_STREQ(Command::retract(10).modal(), "G0");

    Command cut = Command::abs(CommandKind::Cut, 1, 1, -1);
    auto gcode = Command::plunge(-2).toGcode(&cut, Point3D(1, 1, -1), 3);
    EXPECT_EQ(gcode.first, "Z-2");
}

TEST(CommandTest, FeedOnlyWhenItChanges) {
    Command first = Command::abs(CommandKind::Cut, 1, 0, 0).withFeed(300);
    Command same = Command::abs(CommandKind::Cut, 2, 0, 0).withFeed(300);
    Command slower = Command::abs(CommandKind::Cut, 3, 0, 0).withFeed(100);

    EXPECT_EQ(same.toGcode(&first, Point3D(1, 0, 0), 3).first, "X2");
    EXPECT_EQ(slower.toGcode(&same, Point3D(2, 0, 0), 3).first, "X3F100");
}

TEST(CommandTest, NoMotionGivesEmptyLine) {
    Command cut = Command::abs(CommandKind::Cut, 1, 2, 3);
    auto gcode = cut.toGcode(nullptr, Point3D(1.0001, 2, 3), 3);
    EXPECT_TRUE(gcode.first.empty());
}

TEST(CommandTest, PrecisionRoundsCoordinates) {
    Command cut = Command::abs(CommandKind::Cut, 1.23456, -0.5, std::nullopt);
    EXPECT_EQ(cut.toGcode(nullptr, Point3D(0, 0, 0), 2).first, "G1X1.23Y-0.5");
}

TEST(CommandTest, RelativeCommandsResolveFromStart) {
    Command move = Command::rel(CommandKind::Cut, 1, std::nullopt, -1);
    EXPECT_EQ(move.endPoint(Point3D(2, 3, 0)), Point3D(3, 3, -1));
    EXPECT_EQ(move.toGcode(nullptr, Point3D(2, 3, 0), 3).first, "G1X3Z-1");
}

TEST(CommandTest, ZOnlyKindsRejectXY) {
    EXPECT_THROW(Command::abs(CommandKind::Plunge, 1, 0, -1), std::invalid_argument);
    EXPECT_THROW(Command::rel(CommandKind::Retract, std::nullopt, 1), std::invalid_argument);
    EXPECT_THROW(Command::abs(CommandKind::CircularCW, 1, 0), std::invalid_argument);
    EXPECT_THROW(Command::arc(CommandKind::Cut, CommandVector(), CommandVector(), CommandVector()),
                 std::invalid_argument);
}

TEST(CommandSequenceTest, ReverseSwapsArcDirection) {
    Point3D start(-1, 0, 0);
    Point3D end(1, 0, 0);
    CommandSequence sequence(start, {
        Command::arc(CommandKind::CircularCW, CommandVector(1, 0, std::nullopt),
                     CommandVector(0, 0, std::nullopt), CommandVector(0, 1, std::nullopt)),
    }, end);

    sequence.reverse();

    EXPECT_EQ(sequence.start, end);
    EXPECT_EQ(sequence.end, start);
    ASSERT_EQ(sequence.commands.size(), 1u);
    EXPECT_EQ(sequence.commands[0].getKind(), CommandKind::CircularCCW);
    EXPECT_EQ(sequence.commands[0].endPoint(end), start);
    EXPECT_EQ(sequence.commands[0].toGcode(nullptr, end, 3).first, "G3X-1I-1J0");
}

TEST(CommandSequenceTest, ReverseTwiceRestoresSequence) {
    Point3D start(0, 0, 0);
    std::vector<Command> commands = {
        Command::abs(CommandKind::Cut, 5, 0, 0),
        Command::rel(CommandKind::Cut, 0, 5, -1),
        Command::arc(CommandKind::CircularCCW, CommandVector(0, 5, std::nullopt),
                     CommandVector(2.5, 5, std::nullopt), CommandVector(2.5, 7.5, std::nullopt)),
    };
    CommandSequence sequence(start, commands, Point3D(0, 5, -1));
    CommandSequence original = sequence;

    auto ends = sequence.endPoints();
    ASSERT_EQ(ends.size(), 3u);
    EXPECT_EQ(ends.back(), Point3D(0, 5, -1));

    sequence.reverse();
    EXPECT_FALSE(sequence == original);
    EXPECT_EQ(sequence.endPoints().back(), start);

    sequence.reverse();
    EXPECT_TRUE(sequence == original);
}

TEST(ConfigCommandTest, StartAndStopSequences) {
    EXPECT_EQ(ConfigCommand::startSequence().toGcode(), "M3");
    EXPECT_EQ(ConfigCommand::startSequence(1000).toGcode(), "M3 S1000");
    EXPECT_EQ(ConfigCommand::startSequence(std::nullopt, CoolantState::Flood).toGcode(), "M3 M8");
    EXPECT_EQ(ConfigCommand::startSequence(std::nullopt, CoolantState::Mist).toGcode(), "M3 M7");
    EXPECT_EQ(ConfigCommand::startSequence(1000, CoolantState::Flood).toGcode(), "M3 S1000 M8");
    EXPECT_EQ(ConfigCommand::stopSequence().toGcode(), "M5");
    EXPECT_EQ(ConfigCommand::stopSequence(CoolantState::Flood).toGcode(), "M5 M9");
}

TEST(ConfigCommandTest, SafetyBlock) {
    EXPECT_EQ(ConfigCommand::safetyBlock().toGcode(), "G90 G54 G64 G50 G17 G94\nG49 G40 G80\nG21\nG30");
    EXPECT_EQ(ConfigCommand::safetyBlock(Unit::Imperial).toGcode(),
              "G90 G54 G64 G50 G17 G94\nG49 G40 G80\nG20\nG30");
}

TEST(ConfigCommandTest, ToolChange) {
    EXPECT_EQ(ConfigCommand::toolChange(2).toGcode(), "M5\nG30\nM1\nT2 G43 H2 M6\nM3");
    EXPECT_EQ(ConfigCommand::toolChange(2, 1000).toGcode(), "M5\nG30\nM1\nT2 G43 H2 M6\nM3 S1000");
    EXPECT_EQ(ConfigCommand::toolChange(2, std::nullopt, CoolantState::Flood).toGcode(),
              "M5 M9\nG30\nM1\nT2 G43 H2 M6\nM3 M8");
    EXPECT_EQ(ConfigCommand::toolChange(2, std::nullopt, CoolantState::Mist).toGcode(),
              "M5 M9\nG30\nM1\nT2 G43 H2 M6\nM3 M7");
    EXPECT_EQ(ConfigCommand::toolChange(2, 1000, CoolantState::Flood).toGcode(),
              "M5 M9\nG30\nM1\nT2 G43 H2 M6\nM3 S1000 M8");
}
