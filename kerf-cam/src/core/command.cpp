#include "core/command.h"
#include "kerf-cam/utils.h"
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace kerf {
namespace cam {

namespace {

const CommandKindTraits KIND_TRAITS[] = {
    // modal, name, circular, zOnly
    {"G0", "Rapid", false, false},
    {"G1", "Cut", false, false},
    {"G1", "Plunge", false, true},
    {"G0", "Retract", false, true},
    {"G2", "CircularCW", true, false},
    {"G3", "CircularCCW", true, false},
};

bool sameComponent(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) {
        return false;
    }
    return !a || std::fabs(*a - *b) < 1e-9;
}

// Same vector seen from a different start point
CommandVector rebase(const CommandVector& v, const Point3D& oldStart, const Point3D& newStart) {
    if (!v.relative) {
        return v;
    }

    CommandVector result = v;
    if (v.x) result.x = oldStart.x + *v.x - newStart.x;
    if (v.y) result.y = oldStart.y + *v.y - newStart.y;
    if (v.z) result.z = oldStart.z + *v.z - newStart.z;
    return result;
}

} // namespace

const CommandKindTraits& commandKindTraits(CommandKind kind) {
    return KIND_TRAITS[static_cast<int>(kind)];
}

// ================================
// CommandVector
// ================================

Point3D CommandVector::resolve(const Point3D& origin) const {
    if (relative) {
        return Point3D(origin.x + x.value_or(0.0),
                       origin.y + y.value_or(0.0),
                       origin.z + z.value_or(0.0));
    }
    return Point3D(x.value_or(origin.x), y.value_or(origin.y), z.value_or(origin.z));
}

Point3D CommandVector::offsetFrom(const Point3D& origin) const {
    if (relative) {
        return Point3D(x.value_or(0.0), y.value_or(0.0), z.value_or(0.0));
    }
    return Point3D(x ? *x - origin.x : 0.0,
                   y ? *y - origin.y : 0.0,
                   z ? *z - origin.z : 0.0);
}

bool CommandVector::operator==(const CommandVector& other) const {
    return relative == other.relative &&
           sameComponent(x, other.x) && sameComponent(y, other.y) && sameComponent(z, other.z);
}

// ================================
// Command
// ================================

Command::Command(CommandKind kind, const CommandVector& end)
    : m_kind(kind), m_end(end) {}

Command Command::abs(CommandKind kind, std::optional<double> x, std::optional<double> y,
                     std::optional<double> z) {
    const CommandKindTraits& traits = commandKindTraits(kind);
    if (traits.circular) {
        throw std::invalid_argument("Circular commands need a center, use Command::arc");
    }
    if (traits.zOnly && (x || y)) {
        throw std::invalid_argument(std::string(traits.name) + " can only operate on z axis");
    }
    return Command(kind, CommandVector(x, y, z, false));
}

Command Command::rel(CommandKind kind, std::optional<double> x, std::optional<double> y,
                     std::optional<double> z) {
    const CommandKindTraits& traits = commandKindTraits(kind);
    if (traits.circular) {
        throw std::invalid_argument("Circular commands need a center, use Command::arc");
    }
    if (traits.zOnly && (x || y)) {
        throw std::invalid_argument(std::string(traits.name) + " can only operate on z axis");
    }
    return Command(kind, CommandVector(x, y, z, true));
}

Command Command::plunge(double z) {
    return abs(CommandKind::Plunge, std::nullopt, std::nullopt, z);
}

Command Command::retract(double z) {
    return abs(CommandKind::Retract, std::nullopt, std::nullopt, z);
}

Command Command::arc(CommandKind kind, const CommandVector& end,
                     const CommandVector& center, const CommandVector& mid) {
    if (!commandKindTraits(kind).circular) {
        throw std::invalid_argument("Command::arc needs CircularCW or CircularCCW");
    }

    Command command(kind, end);
    command.m_center = center;
    command.m_mid = mid;
    return command;
}

Command Command::withFeed(double feed) const {
    Command command = *this;
    command.m_feed = feed;
    return command;
}

Point3D Command::endPoint(const Point3D& start) const {
    return m_end.resolve(start);
}

std::pair<std::string, Point3D> Command::toGcode(const Command* previous,
                                                 const Point3D& start,
                                                 int precision) const {
    Point3D end = endPoint(start);

    std::string xyz;
    std::string endX = Utils::formatNumber(end.x, precision);
    std::string endY = Utils::formatNumber(end.y, precision);
    std::string endZ = Utils::formatNumber(end.z, precision);

    if (endX != Utils::formatNumber(start.x, precision)) {
        xyz += "X" + endX;
    }
    if (endY != Utils::formatNumber(start.y, precision)) {
        xyz += "Y" + endY;
    }
    if (endZ != Utils::formatNumber(start.z, precision)) {
        xyz += "Z" + endZ;
    }

    // Arc centers are always relative to the arc start
    std::string ijk;
    if (isCircular()) {
        Point3D center = m_center.offsetFrom(start);
        if (m_center.x) {
            ijk += "I" + Utils::formatNumber(center.x, precision);
        }
        if (m_center.y) {
            ijk += "J" + Utils::formatNumber(center.y, precision);
        }
        if (m_center.z) {
            ijk += "K" + Utils::formatNumber(center.z, precision);
        }
    }

    if (xyz.empty() && ijk.empty()) {
        return std::make_pair(std::string(), end);
    }

    std::string line;
    if (previous == nullptr || std::strcmp(previous->modal(), modal()) != 0) {
        line += modal();
    }
    line += xyz;
    line += ijk;

    if (m_feed && (previous == nullptr || previous->getFeed() != m_feed)) {
        line += "F" + Utils::formatNumber(*m_feed, precision);
    }

    return std::make_pair(line, end);
}

Command Command::reversed(const Point3D& start, const Point3D& end) const {
    CommandKind kind = m_kind;
    if (kind == CommandKind::CircularCW) {
        kind = CommandKind::CircularCCW;
    } else if (kind == CommandKind::CircularCCW) {
        kind = CommandKind::CircularCW;
    }

    CommandVector newEnd;
    if (m_end.relative) {
        newEnd.relative = true;
        if (m_end.x) newEnd.x = -*m_end.x;
        if (m_end.y) newEnd.y = -*m_end.y;
        if (m_end.z) newEnd.z = -*m_end.z;
    } else {
        if (m_end.x) newEnd.x = start.x;
        if (m_end.y) newEnd.y = start.y;
        if (m_end.z) newEnd.z = start.z;
    }

    Command command(kind, newEnd);
    command.m_center = rebase(m_center, start, end);
    command.m_mid = rebase(m_mid, start, end);
    command.m_feed = m_feed;
    return command;
}

bool Command::operator==(const Command& other) const {
    return m_kind == other.m_kind &&
           m_end == other.m_end &&
           m_center == other.m_center &&
           m_mid == other.m_mid &&
           m_feed == other.m_feed;
}

// ================================
// CommandSequence
// ================================

std::vector<Point3D> CommandSequence::endPoints() const {
    std::vector<Point3D> points;
    Point3D position = start;
    for (const auto& command : commands) {
        position = command.endPoint(position);
        points.push_back(position);
    }
    return points;
}

void CommandSequence::reverse() {
    std::vector<Point3D> positions;
    positions.push_back(start);
    std::vector<Point3D> ends = endPoints();
    positions.insert(positions.end(), ends.begin(), ends.end());

    std::vector<Command> reversedCommands;
    for (size_t i = commands.size(); i > 0; --i) {
        reversedCommands.push_back(commands[i - 1].reversed(positions[i - 1], positions[i]));
    }

    commands = reversedCommands;
    std::swap(start, end);
}

bool CommandSequence::operator==(const CommandSequence& other) const {
    return start == other.start && end == other.end && commands == other.commands;
}

// ================================
// ConfigCommand
// ================================

ConfigCommand::ConfigCommand(Type type)
    : m_type(type), m_unit(Unit::Metric), m_toolNumber(0) {}

ConfigCommand ConfigCommand::startSequence(std::optional<int> speed, std::optional<CoolantState> coolant) {
    ConfigCommand command(Type::StartSequence);
    command.m_speed = speed;
    command.m_coolant = coolant;
    return command;
}

ConfigCommand ConfigCommand::stopSequence(std::optional<CoolantState> coolant) {
    ConfigCommand command(Type::StopSequence);
    command.m_coolant = coolant;
    return command;
}

ConfigCommand ConfigCommand::safetyBlock(Unit unit) {
    ConfigCommand command(Type::SafetyBlock);
    command.m_unit = unit;
    return command;
}

ConfigCommand ConfigCommand::toolChange(int toolNumber, std::optional<int> speed,
                                        std::optional<CoolantState> coolant) {
    ConfigCommand command(Type::ToolChange);
    command.m_toolNumber = toolNumber;
    command.m_speed = speed;
    command.m_coolant = coolant;
    return command;
}

std::string ConfigCommand::toGcode() const {
    switch (m_type) {
        case Type::StartSequence: {
            std::string gcode = "M3";
            if (m_speed) {
                gcode += " S" + std::to_string(*m_speed);
            }
            if (m_coolant) {
                gcode += (*m_coolant == CoolantState::Flood) ? " M8" : " M7";
            }
            return gcode;
        }

        case Type::StopSequence:
            return m_coolant ? "M5 M9" : "M5";

        case Type::SafetyBlock:
            return std::string("G90 G54 G64 G50 G17 G94\n") +
                   "G49 G40 G80\n" +
                   (m_unit == Unit::Metric ? "G21" : "G20") + "\n" +
                   "G30";

        case Type::ToolChange: {
            std::string tool = std::to_string(m_toolNumber);
            return stopSequence(m_coolant).toGcode() + "\n" +
                   "G30\n" +
                   "M1\n" +
                   "T" + tool + " G43 H" + tool + " M6\n" +
                   startSequence(m_speed, m_coolant).toGcode();
        }
    }

    return "";
}

} // namespace cam
} // namespace kerf
