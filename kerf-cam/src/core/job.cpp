#include "core/job.h"
#include "core/gcode_generator.h"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace kerf {
namespace cam {

// ================================
// Operation
// ================================

Operation::Operation(const std::string& name,
                     const std::vector<ConfigCommand>& configCommands,
                     const std::vector<Command>& commands)
    : m_name(name), m_configCommands(configCommands), m_commands(commands) {}

std::string Operation::toGcode(const JobSettings& settings) const {
    std::ostringstream out;
    out << "(" << settings.name << " - " << m_name << ")";

    for (const auto& config : m_configCommands) {
        out << "\n" << config.toGcode();
    }

    Point3D position(0.0, 0.0, settings.getRapidHeight() + 1.0);
    const Command* previous = nullptr;
    for (const auto& command : m_commands) {
        auto gcode = command.toGcode(previous, position, settings.precision);
        position = gcode.second;

        // Moves to the current position print nothing and leave the modal state alone
        if (gcode.first.empty()) {
            continue;
        }

        out << "\n" << gcode.first;
        previous = &command;
    }

    return out.str();
}

// ================================
// Job
// ================================

Job::Job(const JobSettings& settings)
    : m_settings(settings) {}

Job Job::withOperation(const std::string& name,
                       const std::vector<ConfigCommand>& configCommands,
                       const std::vector<Command>& commands) const {
    Job job = *this;
    job.m_operations.push_back(std::make_shared<const Operation>(name, configCommands, commands));
    return job;
}

Job Job::withTool(const Tool& tool) const {
    if (!tool.isValid()) {
        throw std::invalid_argument("Tool has invalid values");
    }

    Job job = *this;
    std::optional<int> speed = tool.speed ? tool.speed : m_settings.speed;

    if (tool.number && tool.number != m_settings.toolNumber) {
        job = job.withOperation("Tool Change",
                                {ConfigCommand::toolChange(*tool.number, speed, m_settings.coolant)},
                                {});
    } else if (tool.speed && tool.speed != m_settings.speed) {
        job = job.withOperation("Speed Change",
                                {ConfigCommand::startSequence(speed, m_settings.coolant)},
                                {});
    }

    if (tool.diameter) job.m_settings.toolDiameter = tool.diameter;
    if (tool.number) job.m_settings.toolNumber = tool.number;
    if (tool.feed) job.m_settings.feed = *tool.feed;
    job.m_settings.speed = speed;
    return job;
}

Job Job::pocket(const std::vector<PathFace>& opAreas,
                const std::vector<PathFace>& avoidAreas,
                const PocketParams& params,
                const std::optional<Tool>& tool,
                PocketResult* diagnostics) const {
    Job job = tool ? withTool(*tool) : *this;

    PocketResult result = PocketOperation::generate(job.m_settings, opAreas, avoidAreas, params);
    for (const auto& warning : result.warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    if (diagnostics != nullptr) {
        *diagnostics = result;
    }

    return job.withOperation("Pocket", {}, result.commands);
}

Job Job::profile(const std::vector<PathFace>& faces,
                 const ProfileParams& params,
                 const std::optional<Tool>& tool) const {
    Job job = tool ? withTool(*tool) : *this;
    return job.withOperation("Profile", {}, ProfileOperation::generate(job.m_settings, faces, params));
}

Job Job::wireProfile(const std::vector<Wire>& wires,
                     std::optional<double> stepdown,
                     const std::optional<Tool>& tool) const {
    Job job = tool ? withTool(*tool) : *this;
    return job.withOperation("Wire Profile", {},
                             ProfileOperation::generateWires(job.m_settings, wires, stepdown));
}

std::string Job::toGcode() const {
    GCodeGenerator generator;
    return generator.generateGCodeString(*this);
}

bool Job::saveGcode(const std::string& filename) const {
    GCodeGenerator generator;
    return generator.generateGCode(*this, filename);
}

} // namespace cam
} // namespace kerf
