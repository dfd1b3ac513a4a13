#include "kerf-cam/config.h"
#include "kerf-cam/utils.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace kerf {
namespace cam {

JobConfig::JobConfig() {
    setDefaults();
}

JobConfig::~JobConfig() = default;

void JobConfig::setDefaults() {
    // Job properties
    m_jobName = "Job";
    m_units = Unit::Metric;
    m_feedRate = 800.0;
    m_plungeRate = 200.0;
    m_spindleSpeed = 12000;
    m_rapidHeight.reset();
    m_opSafeHeight.reset();
    m_precision = 3;
    m_coolant.reset();
    m_maxStepdownCount = 100;

    // Tool properties
    m_toolDiameter = 3.175;
    m_toolNumber.reset();

    // Pocket properties, unset values use the pocket defaults
    m_stepover.reset();
    m_stepdown.reset();
    m_outerOffset.reset();
    m_innerOffset.reset();
    m_avoidOuterOffset.reset();
    m_avoidInnerOffset.reset();
}

bool JobConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool JobConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    std::string line;
    std::string section;
    int lineNumber = 0;

    // First set defaults, then override with values from file
    setDefaults();

    while (std::getline(file, line)) {
        ++lineNumber;
        line = Utils::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            section = line.substr(1, line.length() - 2);
            continue;
        }

        // Parse key=value
        std::string key, value;
        if (!parseLine(line, key, value)) {
            continue;
        }

        try {
            applyValue(section, key, value);
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value for " << section << "." << key
                      << " on line " << lineNumber << " of " << filename << ": " << value
                      << " (" << e.what() << ")" << std::endl;
            return false;
        }
    }

    return true;
}

void JobConfig::applyValue(const std::string& section, const std::string& key, const std::string& value) {
    // Process the key-value pair according to the section
    if (section == "job") {
        if (key == "name") m_jobName = value;
        else if (key == "units") setUnitsFromString(value);
        else if (key == "feed_rate") m_feedRate = std::stod(value);
        else if (key == "plunge_rate") m_plungeRate = std::stod(value);
        else if (key == "spindle_speed") m_spindleSpeed = std::stoi(value);
        else if (key == "rapid_height") m_rapidHeight = parseOptionalDouble(value);
        else if (key == "op_safe_height") m_opSafeHeight = parseOptionalDouble(value);
        else if (key == "precision") m_precision = std::stoi(value);
        else if (key == "coolant") setCoolantFromString(value);
        else if (key == "max_stepdown_count") m_maxStepdownCount = std::stoi(value);
    }
    else if (section == "tool") {
        if (key == "diameter") m_toolDiameter = std::stod(value);
        else if (key == "number") m_toolNumber = value.empty() ? std::nullopt : std::optional<int>(std::stoi(value));
    }
    else if (section == "pocket") {
        if (key == "stepover") m_stepover = parseOffset(value);
        else if (key == "stepdown") m_stepdown = parseOptionalDouble(value);
        else if (key == "outer_offset") m_outerOffset = parseOffset(value);
        else if (key == "inner_offset") m_innerOffset = parseOffset(value);
        else if (key == "avoid_outer_offset") m_avoidOuterOffset = parseOffset(value);
        else if (key == "avoid_inner_offset") m_avoidInnerOffset = parseOffset(value);
    }
}

bool JobConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    // Write file header
    file << "# kerf-cam Configuration File" << std::endl;
    file << "# Automatically generated" << std::endl << std::endl;

    // Job section
    file << "[job]" << std::endl;
    file << "name=" << m_jobName << std::endl;
    file << "units=" << getUnitsString() << std::endl;
    file << "feed_rate=" << m_feedRate << std::endl;
    file << "plunge_rate=" << m_plungeRate << std::endl;
    file << "spindle_speed=" << m_spindleSpeed << std::endl;
    if (m_rapidHeight) file << "rapid_height=" << *m_rapidHeight << std::endl;
    if (m_opSafeHeight) file << "op_safe_height=" << *m_opSafeHeight << std::endl;
    file << "precision=" << m_precision << std::endl;
    file << "coolant=" << getCoolantString() << std::endl;
    file << "max_stepdown_count=" << m_maxStepdownCount << std::endl << std::endl;

    // Tool section
    file << "[tool]" << std::endl;
    file << "diameter=" << m_toolDiameter << std::endl;
    if (m_toolNumber) file << "number=" << *m_toolNumber << std::endl;
    file << std::endl;

    // Pocket section
    file << "[pocket]" << std::endl;
    if (m_stepover) file << "stepover=" << formatOffset(m_stepover) << std::endl;
    if (m_stepdown) file << "stepdown=" << *m_stepdown << std::endl;
    if (m_outerOffset) file << "outer_offset=" << formatOffset(m_outerOffset) << std::endl;
    if (m_innerOffset) file << "inner_offset=" << formatOffset(m_innerOffset) << std::endl;
    if (m_avoidOuterOffset) file << "avoid_outer_offset=" << formatOffset(m_avoidOuterOffset) << std::endl;
    if (m_avoidInnerOffset) file << "avoid_inner_offset=" << formatOffset(m_avoidInnerOffset) << std::endl;

    if (!file.good()) {
        std::cerr << "Error: Failed writing config file: " << filename << std::endl;
        return false;
    }
    return true;
}

JobSettings JobConfig::toJobSettings() const {
    JobSettings settings;
    settings.name = m_jobName;
    settings.unit = m_units;
    settings.feed = m_feedRate;
    settings.plungeFeed = m_plungeRate;
    settings.speed = m_spindleSpeed;
    settings.toolDiameter = m_toolDiameter;
    settings.toolNumber = m_toolNumber;
    settings.rapidHeight = m_rapidHeight;
    settings.opSafeHeight = m_opSafeHeight;
    settings.precision = m_precision;
    settings.coolant = m_coolant;
    settings.maxStepdownCount = m_maxStepdownCount;
    return settings;
}

PocketParams JobConfig::toPocketParams() const {
    PocketParams params;
    params.outerOffset = m_outerOffset;
    params.innerOffset = m_innerOffset;
    params.avoidOuterOffset = m_avoidOuterOffset;
    params.avoidInnerOffset = m_avoidInnerOffset;
    params.stepover = m_stepover;
    params.stepdown = m_stepdown;
    return params;
}

std::optional<OffsetInput> JobConfig::parseOffset(const std::string& value) {
    std::string text = Utils::trim(value);
    if (text.empty()) {
        return std::nullopt;
    }

    size_t comma = text.find(',');
    size_t used = 0;
    if (comma == std::string::npos) {
        double multiplier = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument("Invalid offset: " + value);
        }
        return OffsetInput(multiplier);
    }

    std::string multiplierText = Utils::trim(text.substr(0, comma));
    std::string distanceText = Utils::trim(text.substr(comma + 1));

    double multiplier = std::stod(multiplierText, &used);
    if (used != multiplierText.size()) {
        throw std::invalid_argument("Invalid offset: " + value);
    }
    double distance = std::stod(distanceText, &used);
    if (used != distanceText.size()) {
        throw std::invalid_argument("Invalid offset: " + value);
    }
    return OffsetInput(multiplier, distance);
}

std::string JobConfig::formatOffset(const std::optional<OffsetInput>& offset) {
    if (!offset) {
        return "";
    }
    if (offset->distance == 0.0) {
        return Utils::formatNumber(offset->multiplier, 6);
    }
    return Utils::formatNumber(offset->multiplier, 6) + "," + Utils::formatNumber(offset->distance, 6);
}

std::optional<double> JobConfig::parseOptionalDouble(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return std::stod(value);
}

bool JobConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = Utils::trim(line.substr(0, pos));
    value = Utils::trim(line.substr(pos + 1));

    return !key.empty();
}

std::string JobConfig::getUnitsString() const {
    return (m_units == Unit::Metric) ? "mm" : "in";
}

void JobConfig::setUnitsFromString(const std::string& units) {
    if (units == "in" || units == "inch" || units == "inches") {
        m_units = Unit::Imperial;
    } else {
        m_units = Unit::Metric;
    }
}

std::string JobConfig::getCoolantString() const {
    if (!m_coolant) {
        return "none";
    }
    return (*m_coolant == CoolantState::Flood) ? "flood" : "mist";
}

void JobConfig::setCoolantFromString(const std::string& coolant) {
    if (coolant == "flood") {
        m_coolant = CoolantState::Flood;
    } else if (coolant == "mist") {
        m_coolant = CoolantState::Mist;
    } else {
        m_coolant.reset();
    }
}

} // namespace cam
} // namespace kerf
