#ifndef KERF_CAM_PROFILE_H
#define KERF_CAM_PROFILE_H

#include "core/command.h"
#include "core/edge.h"
#include "core/geometry.h"
#include "core/job_settings.h"
#include "core/router.h"
#include <optional>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Profile parameters. Offsets are in tool radii, an unset offset skips
 * those loops.
 */
struct ProfileParams {
    std::optional<OffsetInput> outerOffset;
    std::optional<OffsetInput> innerOffset;
    std::optional<double> stepdown;

    ProfileParams()
        : outerOffset(OffsetInput(1.0))
        , innerOffset(OffsetInput(-1.0))
    {}
};

/**
 * 2.5D profiling along face boundaries
 */
class ProfileOperation {
public:
    /**
     * Cut around the loops of the faces, hole loops first.
     * Throws std::invalid_argument without a tool diameter or when neither offset is set.
     */
    static std::vector<Command> generate(const JobSettings& settings,
                                         const std::vector<PathFace>& faces,
                                         const ProfileParams& params = ProfileParams());

    /**
     * Cut along wires that already describe the tool centre
     */
    static std::vector<Command> generateWires(const JobSettings& settings,
                                              const std::vector<Wire>& wires,
                                              std::optional<double> stepdown = std::nullopt);

    /**
     * Copies of a flat wire on every stepdown pass above it, shallowest first,
     * followed by the wire itself.
     * Throws std::runtime_error when more than maxStepdownCount passes are needed.
     */
    static std::vector<Wire> stepdownLayers(const Wire& base,
                                            std::optional<double> stepdown,
                                            int maxStepdownCount);

private:
    static Router::RouteOptions routeOptions(const JobSettings& settings);
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_PROFILE_H
