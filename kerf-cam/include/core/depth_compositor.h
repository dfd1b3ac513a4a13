#ifndef KERF_CAM_DEPTH_COMPOSITOR_H
#define KERF_CAM_DEPTH_COMPOSITOR_H

#include "core/geometry.h"
#include "core/polygon_ops.h"
#include <vector>

namespace kerf {
namespace cam {

/**
 * The pocket boundaries that have to be cleared at one depth level
 */
struct DepthLayer {
    double depth;
    std::vector<PathFace> faces;

    DepthLayer() : depth(0.0) {}
    DepthLayer(double d, const std::vector<PathFace>& f) : depth(d), faces(f) {}
};

/**
 * Merges cut faces and avoid faces found at different depths into one stack
 * of pocket boundaries, shallowest level first.
 */
class DepthCompositor {
public:
    /**
     * Compose the per-depth pocket boundaries.
     *
     * A face also opens material at every level above it, so the level at depth d
     * clears the union of all faces at d or deeper. Avoid outers at d or shallower
     * are then removed from that union. Holes of avoid faces are ignored.
     *
     * @param opFaces Faces to cut, already offset for the tool
     * @param avoidFaces Faces to keep, already offset for the tool (may be empty)
     * @param options Clipper2 options
     * @return One layer per distinct cut depth, ordered from 0 downwards
     */
    static std::vector<DepthLayer> compose(const std::vector<PathFace>& opFaces,
                                           const std::vector<PathFace>& avoidFaces,
                                           const PolygonOps::OffsetOptions& options = PolygonOps::OffsetOptions{});

    /**
     * Distinct depths of the faces, shallowest (closest to 0) first
     */
    static std::vector<double> distinctDepths(const std::vector<PathFace>& faces);

private:
    static constexpr double DEPTH_TOLERANCE = 1e-9;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_DEPTH_COMPOSITOR_H
