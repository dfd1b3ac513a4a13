#ifndef KERF_CAM_GCODE_GENERATOR_H
#define KERF_CAM_GCODE_GENERATOR_H

#include "core/job.h"
#include <ostream>
#include <string>

namespace kerf {
namespace cam {

/**
 * Class for turning a job into a G-code program
 */
class GCodeGenerator {
public:
    GCodeGenerator();
    ~GCodeGenerator();

    /**
     * Generate G-code for a job and write it to a file
     * @param job The job to emit
     * @param outputFile Path to the output G-code file
     * @return True if G-code was successfully written
     */
    bool generateGCode(const Job& job, const std::string& outputFile) const;

    /**
     * Generate G-code as a string without writing to a file
     * @param job The job to emit
     * @return A string containing the generated G-code
     */
    std::string generateGCodeString(const Job& job) const;

private:
    /**
     * Program comment, absolute positioning and unit code
     * @param out The output stream
     * @param settings Settings of the job being emitted
     */
    void writeHeader(std::ostream& out, const JobSettings& settings) const;

    /**
     * Return-home block
     * @param out The output stream
     * @param settings Settings of the job being emitted
     */
    void writeFooter(std::ostream& out, const JobSettings& settings) const;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_GCODE_GENERATOR_H
