#ifndef KERF_CAM_COMMAND_H
#define KERF_CAM_COMMAND_H

#include "core/geometry.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Motion primitives. Plunge and Retract are pure Z moves that share the
 * G-code word of Cut and Rapid respectively.
 */
enum class CommandKind {
    Rapid,
    Cut,
    Plunge,
    Retract,
    CircularCW,
    CircularCCW
};

/**
 * Fixed per-kind behaviour
 */
struct CommandKindTraits {
    const char* modal;      // G-code motion word
    const char* name;       // Human readable name
    bool circular;          // Needs a center and a mid point
    bool zOnly;             // Only the Z axis may be addressed
};

const CommandKindTraits& commandKindTraits(CommandKind kind);

/**
 * Measurement system of a job
 */
enum class Unit {
    Metric,
    Imperial
};

enum class CoolantState {
    Flood,
    Mist
};

/**
 * End point (or arc center/mid point) of a command. Unset axes keep the
 * current position. Relative vectors are added to the current position.
 */
struct CommandVector {
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> z;
    bool relative;

    CommandVector() : relative(false) {}
    CommandVector(std::optional<double> _x, std::optional<double> _y, std::optional<double> _z,
                  bool _relative = false)
        : x(_x), y(_y), z(_z), relative(_relative) {}

    static CommandVector absolute(const Point3D& p) {
        return CommandVector(p.x, p.y, p.z);
    }

    static CommandVector absolute(const Point2D& p) {
        return CommandVector(p.x, p.y, std::nullopt);
    }

    // Position reached when starting from origin
    Point3D resolve(const Point3D& origin) const;

    // Offset from origin, unset axes give 0
    Point3D offsetFrom(const Point3D& origin) const;

    bool isSet() const { return x || y || z; }

    bool operator==(const CommandVector& other) const;
    bool operator!=(const CommandVector& other) const { return !(*this == other); }
};

/**
 * One motion of the tool.
 * Commands are immutable values, the factories below are the only way to build one.
 */
class Command {
public:
    /**
     * Motion to an absolute position, unset axes are left unchanged
     */
    static Command abs(CommandKind kind,
                       std::optional<double> x = std::nullopt,
                       std::optional<double> y = std::nullopt,
                       std::optional<double> z = std::nullopt);

    /**
     * Motion by a relative offset
     */
    static Command rel(CommandKind kind,
                       std::optional<double> x = std::nullopt,
                       std::optional<double> y = std::nullopt,
                       std::optional<double> z = std::nullopt);

    static Command plunge(double z);
    static Command retract(double z);

    /**
     * Circular motion
     * @param kind CircularCW or CircularCCW
     * @param end Arc end point
     * @param center Arc center, absolute or relative to the arc start
     * @param mid A point on the arc, absolute or relative to the arc start
     * @return The arc command
     */
    static Command arc(CommandKind kind, const CommandVector& end,
                       const CommandVector& center, const CommandVector& mid);

    // Copy of this command with a feed rate
    Command withFeed(double feed) const;

    CommandKind getKind() const { return m_kind; }
    const CommandVector& getEnd() const { return m_end; }
    const CommandVector& getCenter() const { return m_center; }
    const CommandVector& getMid() const { return m_mid; }
    std::optional<double> getFeed() const { return m_feed; }

    const char* modal() const { return commandKindTraits(m_kind).modal; }
    bool isCircular() const { return commandKindTraits(m_kind).circular; }

    // Position after executing this command from start
    Point3D endPoint(const Point3D& start) const;

    /**
     * Emit the G-code for this command.
     * The motion word is left out when the previous command used the same one,
     * and only axes whose rounded value changes are printed.
     * @param previous Previously emitted command, nullptr at program start
     * @param start Tool position before this command
     * @param precision Decimal places
     * @return G-code line (empty when nothing moves) and the new tool position
     */
    std::pair<std::string, Point3D> toGcode(const Command* previous,
                                            const Point3D& start,
                                            int precision) const;

    /**
     * The same motion traversed backwards.
     * @param start Where this command starts
     * @param end Where this command ends
     * @return A command moving from end back to start
     */
    Command reversed(const Point3D& start, const Point3D& end) const;

    bool operator==(const Command& other) const;
    bool operator!=(const Command& other) const { return !(*this == other); }

private:
    Command(CommandKind kind, const CommandVector& end);

    CommandKind m_kind;
    CommandVector m_end;
    CommandVector m_center;
    CommandVector m_mid;
    std::optional<double> m_feed;
};

/**
 * A run of commands together with the positions it starts and ends at
 */
struct CommandSequence {
    Point3D start;
    std::vector<Command> commands;
    Point3D end;

    CommandSequence() = default;
    CommandSequence(const Point3D& s, const std::vector<Command>& c, const Point3D& e)
        : start(s), commands(c), end(e) {}

    // Tool position after every command
    std::vector<Point3D> endPoints() const;

    // Traverse the sequence backwards, swapping circular directions
    void reverse();

    bool operator==(const CommandSequence& other) const;
};

/**
 * Non-motion blocks emitted around operations
 */
class ConfigCommand {
public:
    enum class Type {
        StartSequence,
        StopSequence,
        SafetyBlock,
        ToolChange
    };

    static ConfigCommand startSequence(std::optional<int> speed = std::nullopt,
                                       std::optional<CoolantState> coolant = std::nullopt);
    static ConfigCommand stopSequence(std::optional<CoolantState> coolant = std::nullopt);
    static ConfigCommand safetyBlock(Unit unit = Unit::Metric);
    static ConfigCommand toolChange(int toolNumber,
                                    std::optional<int> speed = std::nullopt,
                                    std::optional<CoolantState> coolant = std::nullopt);

    Type getType() const { return m_type; }

    std::string toGcode() const;

private:
    explicit ConfigCommand(Type type);

    Type m_type;
    Unit m_unit;
    int m_toolNumber;
    std::optional<int> m_speed;
    std::optional<CoolantState> m_coolant;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_COMMAND_H
