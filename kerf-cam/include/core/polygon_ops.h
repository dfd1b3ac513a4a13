#ifndef KERF_CAM_POLYGON_OPS_H
#define KERF_CAM_POLYGON_OPS_H

#include "core/geometry.h"
#include <clipper2/clipper.h>
#include <cstddef>
#include <string>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Boolean operations supported by PolygonOps::booleanOp
 */
enum class BooleanOp {
    UNION,
    DIFFERENCE,
    INTERSECTION
};

/**
 * One outer loop together with the holes it directly encloses
 */
struct PolygonWithHoles {
    Polygon outer;
    std::vector<Polygon> holes;
};

/**
 * Clipper2-based offsetting and boolean algebra on closed polygons.
 * Every call scales coordinates to integers, runs Clipper2 and scales back.
 */
class PolygonOps {
public:
    /**
     * Options for fine-tuning offsetting and clipping
     */
    struct OffsetOptions {
        double arcTolerance;      // Arc approximation tolerance for round joins (mm)
        double miterLimit;        // Miter limit for sharp corners
        int scaleFactor;          // Internal scaling factor for Clipper2
        double retryPerturbation; // Distance added to the offset when retrying a failed offset

        OffsetOptions()
            : arcTolerance(0.01)
            , miterLimit(2.0)
            , scaleFactor(1000)
            , retryPerturbation(0.000001)
        {}
    };

    /**
     * Offset a closed polygon. Positive distances grow the polygon, negative shrink it.
     * Degenerate results are dropped, so an empty list means the polygon was consumed.
     * @param polygon Closed input polygon (orientation does not matter)
     * @param distance Signed offset distance
     * @param options Offsetting options
     * @return Closed result polygons
     */
    static std::vector<Polygon> offsetPolygon(const Polygon& polygon,
                                              double distance,
                                              const OffsetOptions& options = OffsetOptions{});

    /**
     * Run a boolean operation and return the result as outer/hole groups.
     * Islands inside holes are returned as separate groups.
     * @param subjects Subject polygons
     * @param clips Clip polygons (may be empty)
     * @param op Operation to perform
     * @param options Scaling options
     * @return Forest of outer polygons with their holes
     */
    static std::vector<PolygonWithHoles> booleanOp(const std::vector<Polygon>& subjects,
                                                   const std::vector<Polygon>& clips,
                                                   BooleanOp op,
                                                   const OffsetOptions& options = OffsetOptions{});

    /**
     * Offset the outer and hole loops of a face independently, then rebuild the
     * outer/hole nesting with a Difference.
     */
    static std::vector<PathFace> offsetFace(const PathFace& face,
                                            double outerOffset,
                                            double innerOffset,
                                            const OffsetOptions& options = OffsetOptions{});

    /**
     * Check that a polygon lies within the material area of a face: inside its
     * outer loop and clear of every hole. Shared boundaries count as inside.
     * @param polygon Polygon to test
     * @param face Containing face candidate
     * @param options Scaling options
     * @return True when nothing of polygon is left outside the face
     */
    static bool isPolygonInsideFace(const Polygon& polygon, const PathFace& face,
                                    const OffsetOptions& options = OffsetOptions{});

    /**
     * Number of offsets given up after the retry since process start
     */
    static size_t failedOffsetCount();

private:
    // Core Clipper2 conversions
    static Clipper2Lib::Path64 polygonToClipper(const Polygon& polygon, int scaleFactor);
    static Clipper2Lib::Paths64 polygonsToClipper(const std::vector<Polygon>& polygons, int scaleFactor);
    static Polygon clipperToPolygon(const Clipper2Lib::Path64& path, int scaleFactor);

    static Clipper2Lib::Paths64 executeOffset(const Clipper2Lib::Paths64& paths,
                                              double distance,
                                              const OffsetOptions& options);
    static void collectForest(const Clipper2Lib::PolyPath64& node,
                              int scaleFactor,
                              std::vector<PolygonWithHoles>& forest);
    static bool isDegenerate(const Polygon& polygon, int scaleFactor);

    static size_t s_failedOffsets;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_POLYGON_OPS_H
