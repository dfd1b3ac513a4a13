#include "core/polygon_ops.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace kerf {
namespace cam {

size_t PolygonOps::s_failedOffsets = 0;

// ================================
// Offsetting
// ================================

std::vector<Polygon> PolygonOps::offsetPolygon(const Polygon& polygon,
                                               double distance,
                                               const OffsetOptions& options) {
    std::vector<Polygon> result;
    if (polygon.size() < 3) {
        return result;
    }

    // Positive distances must always grow the enclosed region
    Polygon oriented = polygon;
    if (oriented.isClockwise()) {
        oriented.reverse();
    }

    Clipper2Lib::Paths64 subject;
    subject.push_back(polygonToClipper(oriented, options.scaleFactor));

    Clipper2Lib::Paths64 offsetPaths = executeOffset(subject, distance, options);

    for (const auto& path : offsetPaths) {
        Polygon offset = clipperToPolygon(path, options.scaleFactor);
        if (!isDegenerate(offset, options.scaleFactor)) {
            result.push_back(offset);
        }
    }

    return result;
}

Clipper2Lib::Paths64 PolygonOps::executeOffset(const Clipper2Lib::Paths64& paths,
                                               double distance,
                                               const OffsetOptions& options) {
    Clipper2Lib::Paths64 offsetPaths;

    try {
        Clipper2Lib::ClipperOffset clipperOffset(options.miterLimit,
                                                 options.arcTolerance * options.scaleFactor);
        clipperOffset.AddPaths(paths, Clipper2Lib::JoinType::Round, Clipper2Lib::EndType::Polygon);
        clipperOffset.Execute(distance * options.scaleFactor, offsetPaths);
        return offsetPaths;
    } catch (const std::exception& e) {
        std::cout << "DEBUG: Offset by " << distance << " failed (" << e.what()
                  << "), retrying with a perturbed distance" << std::endl;
    }

    // Offsets near exact tangency can fail for the exact value and succeed
    // for a slightly different one
    try {
        Clipper2Lib::ClipperOffset clipperOffset(options.miterLimit,
                                                 options.arcTolerance * options.scaleFactor);
        clipperOffset.AddPaths(paths, Clipper2Lib::JoinType::Round, Clipper2Lib::EndType::Polygon);
        clipperOffset.Execute((distance + options.retryPerturbation) * options.scaleFactor,
                              offsetPaths);
    } catch (const std::exception& e) {
        ++s_failedOffsets;
        std::cerr << "Warning: Failed to offset polygon by " << distance
                  << ", dropping it: " << e.what() << std::endl;
        offsetPaths.clear();
    }

    return offsetPaths;
}

std::vector<PathFace> PolygonOps::offsetFace(const PathFace& face,
                                             double outerOffset,
                                             double innerOffset,
                                             const OffsetOptions& options) {
    std::vector<PathFace> faces;

    std::vector<Polygon> outers = offsetPolygon(face.outer, outerOffset, options);
    if (outers.empty()) {
        return faces;
    }

    std::vector<Polygon> inners;
    for (const auto& inner : face.inners) {
        auto offsetInners = offsetPolygon(inner, innerOffset, options);
        inners.insert(inners.end(), offsetInners.begin(), offsetInners.end());
    }

    // Grown holes may cross the shrunk outer or each other, so the nesting
    // has to be rebuilt rather than reused
    auto forest = booleanOp(outers, inners, BooleanOp::DIFFERENCE, options);
    for (const auto& group : forest) {
        faces.emplace_back(group.outer, group.holes, face.depth);
    }

    return faces;
}

// ================================
// Boolean operations
// ================================

std::vector<PolygonWithHoles> PolygonOps::booleanOp(const std::vector<Polygon>& subjects,
                                                    const std::vector<Polygon>& clips,
                                                    BooleanOp op,
                                                    const OffsetOptions& options) {
    std::vector<PolygonWithHoles> forest;
    if (subjects.empty()) {
        return forest;
    }

    Clipper2Lib::ClipType clipType = Clipper2Lib::ClipType::Union;
    switch (op) {
        case BooleanOp::UNION:
            clipType = Clipper2Lib::ClipType::Union;
            break;
        case BooleanOp::DIFFERENCE:
            clipType = Clipper2Lib::ClipType::Difference;
            break;
        case BooleanOp::INTERSECTION:
            clipType = Clipper2Lib::ClipType::Intersection;
            break;
    }

    Clipper2Lib::Clipper64 clipper;
    clipper.AddSubject(polygonsToClipper(subjects, options.scaleFactor));
    if (!clips.empty()) {
        clipper.AddClip(polygonsToClipper(clips, options.scaleFactor));
    }

    Clipper2Lib::PolyTree64 tree;
    if (!clipper.Execute(clipType, Clipper2Lib::FillRule::NonZero, tree)) {
        std::cerr << "Warning: Clipper2 boolean operation failed" << std::endl;
        return forest;
    }

    collectForest(tree, options.scaleFactor, forest);
    return forest;
}

void PolygonOps::collectForest(const Clipper2Lib::PolyPath64& node,
                               int scaleFactor,
                               std::vector<PolygonWithHoles>& forest) {
    for (size_t i = 0; i < node.Count(); ++i) {
        const Clipper2Lib::PolyPath64* outerNode = node.Child(i);

        PolygonWithHoles group;
        group.outer = clipperToPolygon(outerNode->Polygon(), scaleFactor);
        if (isDegenerate(group.outer, scaleFactor)) {
            continue;
        }

        for (size_t j = 0; j < outerNode->Count(); ++j) {
            Polygon hole = clipperToPolygon(outerNode->Child(j)->Polygon(), scaleFactor);
            if (!isDegenerate(hole, scaleFactor)) {
                group.holes.push_back(hole);
            }
        }
        forest.push_back(group);

        // Islands inside the holes become groups of their own
        for (size_t j = 0; j < outerNode->Count(); ++j) {
            collectForest(*outerNode->Child(j), scaleFactor, forest);
        }
    }
}

bool PolygonOps::isPolygonInsideFace(const Polygon& polygon, const PathFace& face,
                                     const OffsetOptions& options) {
    if (polygon.size() < 3 || face.outer.size() < 3) {
        return false;
    }

    // Anything left over after removing the outer loop sticks out of the face
    if (!booleanOp({polygon}, {face.outer}, BooleanOp::DIFFERENCE, options).empty()) {
        return false;
    }

    // An island sitting in one of the holes is not covered by the face
    if (!face.inners.empty() &&
        !booleanOp({polygon}, face.inners, BooleanOp::INTERSECTION, options).empty()) {
        return false;
    }

    return true;
}

size_t PolygonOps::failedOffsetCount() {
    return s_failedOffsets;
}

// ================================
// Clipper2 conversion utilities
// ================================

Clipper2Lib::Path64 PolygonOps::polygonToClipper(const Polygon& polygon, int scaleFactor) {
    Clipper2Lib::Path64 path;
    const auto& points = polygon.getPoints();

    // Clipper2 paths are implicitly closed, drop the repeated closing point
    size_t count = points.size();
    if (polygon.isClosed()) {
        --count;
    }

    for (size_t i = 0; i < count; ++i) {
        path.push_back(Clipper2Lib::Point64(
            static_cast<int64_t>(std::llround(points[i].x * scaleFactor)),
            static_cast<int64_t>(std::llround(points[i].y * scaleFactor))
        ));
    }

    return path;
}

Clipper2Lib::Paths64 PolygonOps::polygonsToClipper(const std::vector<Polygon>& polygons, int scaleFactor) {
    Clipper2Lib::Paths64 paths;
    for (const auto& polygon : polygons) {
        auto path = polygonToClipper(polygon, scaleFactor);
        if (path.size() >= 3) {
            paths.push_back(path);
        }
    }
    return paths;
}

Polygon PolygonOps::clipperToPolygon(const Clipper2Lib::Path64& path, int scaleFactor) {
    Polygon polygon;

    for (const auto& point : path) {
        polygon.addPoint(Point2D(
            static_cast<double>(point.x) / scaleFactor,
            static_cast<double>(point.y) / scaleFactor
        ));
    }

    polygon.close();
    return polygon;
}

bool PolygonOps::isDegenerate(const Polygon& polygon, int scaleFactor) {
    if (polygon.size() < 4) {
        return true;
    }

    // Area below one squared clipper unit rounds to nothing at working precision
    double scaledArea = polygon.area() * scaleFactor * scaleFactor;
    return scaledArea < 1.0;
}

} // namespace cam
} // namespace kerf
