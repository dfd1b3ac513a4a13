#ifndef KERF_CAM_JOB_H
#define KERF_CAM_JOB_H

#include "core/command.h"
#include "core/edge.h"
#include "core/geometry.h"
#include "core/job_settings.h"
#include "core/pocket.h"
#include "core/profile.h"
#include "core/tool.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kerf {
namespace cam {

/**
 * A named block of the program: configuration blocks followed by motion
 */
class Operation {
public:
    Operation(const std::string& name,
              const std::vector<ConfigCommand>& configCommands,
              const std::vector<Command>& commands);

    const std::string& getName() const { return m_name; }
    const std::vector<ConfigCommand>& getConfigCommands() const { return m_configCommands; }
    const std::vector<Command>& getCommands() const { return m_commands; }

    /**
     * G-code of this operation. Motion starts one unit above the rapid height
     * over the origin so the first retract is always emitted.
     * @param settings Job settings (name, precision, rapid height)
     * @return Lines joined by newlines, without a trailing newline
     */
    std::string toGcode(const JobSettings& settings) const;

private:
    std::string m_name;
    std::vector<ConfigCommand> m_configCommands;
    std::vector<Command> m_commands;
};

/**
 * A machining session.
 *
 * Jobs are immutable: every operation method returns a new job with the
 * operation appended and leaves this one untouched. Operations are shared
 * between the copies.
 */
class Job {
public:
    explicit Job(const JobSettings& settings = JobSettings());

    const JobSettings& getSettings() const { return m_settings; }
    const std::vector<std::shared_ptr<const Operation>>& getOperations() const { return m_operations; }

    /**
     * Clear pockets
     * @param opAreas Faces to clear
     * @param avoidAreas Faces to keep
     * @param params Pocket parameters
     * @param tool Tool to switch to before the pocket
     * @param diagnostics Receives the pocket result when not null
     * @return New job with the pocket appended
     */
    Job pocket(const std::vector<PathFace>& opAreas,
               const std::vector<PathFace>& avoidAreas = std::vector<PathFace>(),
               const PocketParams& params = PocketParams(),
               const std::optional<Tool>& tool = std::nullopt,
               PocketResult* diagnostics = nullptr) const;

    /**
     * Cut around faces, hole loops first
     */
    Job profile(const std::vector<PathFace>& faces,
                const ProfileParams& params = ProfileParams(),
                const std::optional<Tool>& tool = std::nullopt) const;

    /**
     * Cut along ready-made tool centre wires
     */
    Job wireProfile(const std::vector<Wire>& wires,
                    std::optional<double> stepdown = std::nullopt,
                    const std::optional<Tool>& tool = std::nullopt) const;

    // Full program text
    std::string toGcode() const;

    // Write the program to a file
    bool saveGcode(const std::string& filename) const;

private:
    Job withTool(const Tool& tool) const;
    Job withOperation(const std::string& name,
                      const std::vector<ConfigCommand>& configCommands,
                      const std::vector<Command>& commands) const;

    JobSettings m_settings;
    std::vector<std::shared_ptr<const Operation>> m_operations;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_JOB_H
