#include "core/gcode_generator.h"
#include "kerf-cam/utils.h"
#include <fstream>
#include <iostream>
#include <sstream>

namespace kerf {
namespace cam {

GCodeGenerator::GCodeGenerator() {}

GCodeGenerator::~GCodeGenerator() {}

bool GCodeGenerator::generateGCode(const Job& job, const std::string& outputFile) const {
    std::ofstream file(outputFile);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << outputFile << std::endl;
        return false;
    }

    file << generateGCodeString(job);
    if (!file.good()) {
        std::cerr << "Error: Failed writing G-code to " << outputFile << std::endl;
        return false;
    }

    std::cout << "DEBUG: Wrote " << job.getOperations().size()
              << " operations to " << outputFile << std::endl;
    return true;
}

std::string GCodeGenerator::generateGCodeString(const Job& job) const {
    const JobSettings& settings = job.getSettings();
    std::stringstream ss;

    writeHeader(ss, settings);

    // Operations are separated by two blank lines
    const auto& operations = job.getOperations();
    for (size_t i = 0; i < operations.size(); ++i) {
        if (i > 0) {
            ss << "\n\n\n";
        }
        ss << operations[i]->toGcode(settings);
    }
    ss << "\n";

    writeFooter(ss, settings);
    return ss.str();
}

void GCodeGenerator::writeHeader(std::ostream& out, const JobSettings& settings) const {
    out << "(" << settings.name
        << " - Feedrate: " << Utils::formatNumber(settings.feed, settings.precision)
        << " - Unit: " << settings.getUnitName() << ")\n";
    out << "G90\n";
    out << settings.getUnitCode() << "\n";
}

void GCodeGenerator::writeFooter(std::ostream& out, const JobSettings& settings) const {
    out << "G1Z0\n";
    out << "G0Z" << Utils::formatNumber(settings.getRapidHeight(), settings.precision) << "\n";
    out << "X0Y0";
}

} // namespace cam
} // namespace kerf
