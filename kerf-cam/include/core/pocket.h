#ifndef KERF_CAM_POCKET_H
#define KERF_CAM_POCKET_H

#include "core/command.h"
#include "core/contour_fill.h"
#include "core/geometry.h"
#include "core/job_settings.h"
#include <optional>
#include <string>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Pocket parameters. Offsets are in tool radii (see OffsetInput), unset
 * values take the pocket defaults.
 */
struct PocketParams {
    std::optional<OffsetInput> outerOffset;       // Default -1, or 0 when avoid areas are given
    std::optional<OffsetInput> innerOffset;       // Default +1
    std::optional<OffsetInput> avoidOuterOffset;  // Default +1
    std::optional<OffsetInput> avoidInnerOffset;  // Default -1
    std::optional<OffsetInput> stepover;          // Default 1.5
    std::optional<double> stepdown;               // Cut in one pass when unset
};

/**
 * Result of a pocket operation
 */
struct PocketResult {
    std::vector<Command> commands;          // Routed toolpath
    std::vector<PathFace> pockets;          // Composed pocket boundaries, shallowest first
    std::vector<FillSequence> sequences;    // Fill sequences at the pocket depths
    size_t layers;                          // Depth passes routed over all pockets

    bool success;
    std::vector<std::string> warnings;

    PocketResult() : layers(0), success(false) {}

    bool hasWarnings() const { return !warnings.empty(); }
    bool isValid() const { return success; }
};

/**
 * 2.5D pocket clearing.
 *
 * Faces are offset for the tool, merged into per-depth pocket boundaries,
 * filled with nested contours, repeated on every stepdown pass and routed.
 */
class PocketOperation {
public:
    /**
     * Generate the pocket toolpath.
     * Throws std::invalid_argument for configuration errors (no tool diameter,
     * non-positive stepover or stepdown, faces above the job plane).
     * @param settings Job settings
     * @param opAreas Faces to clear
     * @param avoidAreas Faces the tool must stay out of
     * @param params Pocket parameters
     * @return Commands together with the intermediate geometry
     */
    static PocketResult generate(const JobSettings& settings,
                                 const std::vector<PathFace>& opAreas,
                                 const std::vector<PathFace>& avoidAreas,
                                 const PocketParams& params = PocketParams());
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_POCKET_H
