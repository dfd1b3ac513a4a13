#ifndef KERF_CAM_CONFIG_H
#define KERF_CAM_CONFIG_H

#include "core/command.h"
#include "core/job_settings.h"
#include "core/pocket.h"
#include <optional>
#include <string>

namespace kerf {
namespace cam {

/**
 * Job, tool and pocket settings stored in an INI file
 */
class JobConfig {
public:
    JobConfig();
    ~JobConfig();

    /**
     * Initialize with default values
     */
    void setDefaults();

    /**
     * Load configuration from file
     * @param filename Path to the config file
     * @return True if loaded successfully
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    /**
     * Job settings described by this configuration
     */
    JobSettings toJobSettings() const;

    /**
     * Pocket parameters described by this configuration
     */
    PocketParams toPocketParams() const;

    // Job section
    const std::string& getJobName() const { return m_jobName; }
    void setJobName(const std::string& name) { m_jobName = name; }

    Unit getUnits() const { return m_units; }
    void setUnits(Unit units) { m_units = units; }
    std::string getUnitsString() const;
    void setUnitsFromString(const std::string& units);

    double getFeedRate() const { return m_feedRate; }
    void setFeedRate(double rate) { m_feedRate = rate; }

    double getPlungeRate() const { return m_plungeRate; }
    void setPlungeRate(double rate) { m_plungeRate = rate; }

    int getSpindleSpeed() const { return m_spindleSpeed; }
    void setSpindleSpeed(int speed) { m_spindleSpeed = speed; }

    std::optional<double> getRapidHeight() const { return m_rapidHeight; }
    void setRapidHeight(std::optional<double> height) { m_rapidHeight = height; }

    std::optional<double> getOpSafeHeight() const { return m_opSafeHeight; }
    void setOpSafeHeight(std::optional<double> height) { m_opSafeHeight = height; }

    int getPrecision() const { return m_precision; }
    void setPrecision(int precision) { m_precision = precision; }

    std::optional<CoolantState> getCoolant() const { return m_coolant; }
    void setCoolant(std::optional<CoolantState> coolant) { m_coolant = coolant; }
    std::string getCoolantString() const;
    void setCoolantFromString(const std::string& coolant);

    int getMaxStepdownCount() const { return m_maxStepdownCount; }
    void setMaxStepdownCount(int count) { m_maxStepdownCount = count; }

    // Tool section
    double getToolDiameter() const { return m_toolDiameter; }
    void setToolDiameter(double diameter) { m_toolDiameter = diameter; }

    std::optional<int> getToolNumber() const { return m_toolNumber; }
    void setToolNumber(std::optional<int> number) { m_toolNumber = number; }

    // Pocket section
    std::optional<OffsetInput> getStepover() const { return m_stepover; }
    void setStepover(std::optional<OffsetInput> stepover) { m_stepover = stepover; }

    std::optional<double> getStepdown() const { return m_stepdown; }
    void setStepdown(std::optional<double> stepdown) { m_stepdown = stepdown; }

    std::optional<OffsetInput> getOuterOffset() const { return m_outerOffset; }
    void setOuterOffset(std::optional<OffsetInput> offset) { m_outerOffset = offset; }

    std::optional<OffsetInput> getInnerOffset() const { return m_innerOffset; }
    void setInnerOffset(std::optional<OffsetInput> offset) { m_innerOffset = offset; }

    std::optional<OffsetInput> getAvoidOuterOffset() const { return m_avoidOuterOffset; }
    void setAvoidOuterOffset(std::optional<OffsetInput> offset) { m_avoidOuterOffset = offset; }

    std::optional<OffsetInput> getAvoidInnerOffset() const { return m_avoidInnerOffset; }
    void setAvoidInnerOffset(std::optional<OffsetInput> offset) { m_avoidInnerOffset = offset; }

    /**
     * Parse an offset written as "multiplier" or "multiplier,distance".
     * An empty string gives no offset.
     * Throws std::invalid_argument for anything else.
     */
    static std::optional<OffsetInput> parseOffset(const std::string& value);

    // Inverse of parseOffset
    static std::string formatOffset(const std::optional<OffsetInput>& offset);

private:
    // Job properties
    std::string m_jobName;
    Unit m_units;
    double m_feedRate;                      // Feed rate for X/Y movement (units/min)
    double m_plungeRate;                    // Feed rate for Z movement (units/min)
    int m_spindleSpeed;                     // Spindle speed (RPM)
    std::optional<double> m_rapidHeight;
    std::optional<double> m_opSafeHeight;
    int m_precision;
    std::optional<CoolantState> m_coolant;
    int m_maxStepdownCount;

    // Tool properties
    double m_toolDiameter;
    std::optional<int> m_toolNumber;

    // Pocket properties
    std::optional<OffsetInput> m_stepover;
    std::optional<double> m_stepdown;
    std::optional<OffsetInput> m_outerOffset;
    std::optional<OffsetInput> m_innerOffset;
    std::optional<OffsetInput> m_avoidOuterOffset;
    std::optional<OffsetInput> m_avoidInnerOffset;

    // Helper methods for parsing
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    void applyValue(const std::string& section, const std::string& key, const std::string& value);
    static std::optional<double> parseOptionalDouble(const std::string& value);
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_CONFIG_H
