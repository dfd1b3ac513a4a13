#ifndef KERF_CAM_JOB_SETTINGS_H
#define KERF_CAM_JOB_SETTINGS_H

#include "core/command.h"
#include <optional>
#include <string>

namespace kerf {
namespace cam {

/**
 * An offset expressed in tool radii plus an optional fixed distance
 */
struct OffsetInput {
    double multiplier;
    double distance;

    OffsetInput(double m = 0.0, double d = 0.0) : multiplier(m), distance(d) {}
};

/**
 * Resolve an offset to a distance
 * @param toolRadius Radius of the active tool
 * @param offset Requested offset, or nothing for the default
 * @param defaultMultiplier Multiplier used when no offset is requested
 * @return toolRadius * multiplier + distance
 */
double calculateOffset(double toolRadius, const std::optional<OffsetInput>& offset,
                       double defaultMultiplier = 0.0);

/**
 * Machining session settings shared by every operation of a job
 */
struct JobSettings {
    std::string name;
    double feed;                            // Feed rate for X/Y movement (units/min)
    std::optional<double> plungeFeed;       // Feed rate for Z movement, defaults to feed
    std::optional<int> speed;               // Spindle speed (RPM)
    std::optional<double> toolDiameter;
    std::optional<int> toolNumber;
    std::optional<double> rapidHeight;      // Travel height, defaults per unit
    std::optional<double> opSafeHeight;     // Height to rapid down to before plunging, defaults per unit
    int precision;                          // Decimal places in the G-code
    Unit unit;
    std::optional<CoolantState> coolant;
    int maxStepdownCount;

    JobSettings()
        : name("Job")
        , feed(0.0)
        , precision(3)
        , unit(Unit::Metric)
        , maxStepdownCount(100)
    {}

    double getPlungeFeed() const;
    double getRapidHeight() const;
    double getOpSafeHeight() const;

    // Half the tool diameter, throws std::invalid_argument without a tool diameter
    double requireToolRadius(const std::string& operation) const;

    // "METRIC" or "IMPERIAL"
    std::string getUnitName() const;

    // "G21" or "G20"
    std::string getUnitCode() const;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_JOB_SETTINGS_H
