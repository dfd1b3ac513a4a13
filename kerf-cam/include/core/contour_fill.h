#ifndef KERF_CAM_CONTOUR_FILL_H
#define KERF_CAM_CONTOUR_FILL_H

#include "core/branch_tree.h"
#include "core/geometry.h"
#include "core/polygon_ops.h"
#include <vector>

namespace kerf {
namespace cam {

/**
 * One continuous chain of nested contours at a single depth.
 * Contours are ordered innermost first.
 */
struct FillSequence {
    double depth;
    std::vector<Polygon> polygons;

    FillSequence() : depth(0.0) {}
    FillSequence(double d, const std::vector<Polygon>& p) : depth(d), polygons(p) {}
};

/**
 * Contour-shrink pocket clearing.
 *
 * The pocket outer is offset inwards by the stepover until nothing is left.
 * Each offset result becomes a child of the contour it came from, so a
 * contour that splits around an island grows separate branches.
 */
class ContourFill {
public:
    /**
     * Grow the contour tree of a pocket
     * @param pocket Pocket boundary, its holes are kept out of every contour
     * @param stepover Distance between neighbouring contours, must be positive
     * @param options Clipper2 options
     * @return Tree rooted at the pocket outer with every leaf locked
     */
    static BranchTree<Polygon> buildTree(const PathFace& pocket,
                                         double stepover,
                                         const PolygonOps::OffsetOptions& options = PolygonOps::OffsetOptions{});

    /**
     * Clear a pocket with nested contours
     * @param pocket Pocket boundary
     * @param stepover Distance between neighbouring contours, must be positive
     * @param options Clipper2 options
     * @return Chains covering every contour once, longest chain first
     */
    static std::vector<FillSequence> fillPocket(const PathFace& pocket,
                                                double stepover,
                                                const PolygonOps::OffsetOptions& options = PolygonOps::OffsetOptions{});
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_CONTOUR_FILL_H
