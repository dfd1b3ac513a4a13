#include "core/depth_compositor.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>

namespace kerf {
namespace cam {

std::vector<double> DepthCompositor::distinctDepths(const std::vector<PathFace>& faces) {
    std::vector<double> depths;
    for (const auto& face : faces) {
        depths.push_back(face.depth);
    }

    std::sort(depths.begin(), depths.end(), std::greater<double>());
    depths.erase(std::unique(depths.begin(), depths.end(),
                             [](double a, double b) { return std::fabs(a - b) < DEPTH_TOLERANCE; }),
                 depths.end());
    return depths;
}

std::vector<DepthLayer> DepthCompositor::compose(const std::vector<PathFace>& opFaces,
                                                 const std::vector<PathFace>& avoidFaces,
                                                 const PolygonOps::OffsetOptions& options) {
    std::vector<DepthLayer> layers;

    for (double depth : distinctDepths(opFaces)) {
        // Outers wind counter-clockwise and holes clockwise, so a non-zero union
        // removes a hole only where no other active face covers it
        std::vector<Polygon> regions;
        for (const auto& face : opFaces) {
            if (face.depth > depth + DEPTH_TOLERANCE) {
                continue;
            }

            Polygon outer = face.outer;
            if (outer.isClockwise()) {
                outer.reverse();
            }
            regions.push_back(outer);

            for (const auto& inner : face.inners) {
                Polygon hole = inner;
                if (!hole.isClockwise()) {
                    hole.reverse();
                }
                regions.push_back(hole);
            }
        }

        auto forest = PolygonOps::booleanOp(regions, {}, BooleanOp::UNION, options);

        if (!avoidFaces.empty()) {
            std::vector<Polygon> subjects;
            for (const auto& group : forest) {
                subjects.push_back(group.outer);
                for (const auto& hole : group.holes) {
                    Polygon reversedHole = hole;
                    if (!reversedHole.isClockwise()) {
                        reversedHole.reverse();
                    }
                    subjects.push_back(reversedHole);
                }
            }

            // Only the outer boundary of an avoid area is honoured
            std::vector<Polygon> clips;
            for (const auto& avoid : avoidFaces) {
                if (avoid.depth >= depth - DEPTH_TOLERANCE) {
                    clips.push_back(avoid.outer);
                }
            }

            if (!clips.empty()) {
                forest = PolygonOps::booleanOp(subjects, clips, BooleanOp::DIFFERENCE, options);
            }
        }

        DepthLayer layer;
        layer.depth = depth;
        for (const auto& group : forest) {
            layer.faces.emplace_back(group.outer, group.holes, depth);
        }

        std::cout << "DEBUG: Depth " << depth << " has " << layer.faces.size()
                  << " pocket boundaries" << std::endl;
        layers.push_back(layer);
    }

    return layers;
}

} // namespace cam
} // namespace kerf
