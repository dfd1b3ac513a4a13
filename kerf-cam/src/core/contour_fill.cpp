#include "core/contour_fill.h"
#include <iostream>
#include <stdexcept>

namespace kerf {
namespace cam {

BranchTree<Polygon> ContourFill::buildTree(const PathFace& pocket,
                                           double stepover,
                                           const PolygonOps::OffsetOptions& options) {
    if (stepover <= 0.0) {
        throw std::invalid_argument("Stepover must be greater than zero");
    }

    BranchTree<Polygon> tree(pocket.outer);

    while (auto leaf = tree.nextUnlockedLeaf()) {
        std::vector<Polygon> candidates = PolygonOps::offsetPolygon(tree.value(*leaf), -stepover, options);

        std::vector<Polygon> nextOuters;
        if (!pocket.inners.empty() && !candidates.empty()) {
            // Candidates crossing a hole are split into the parts outside of it
            auto forest = PolygonOps::booleanOp(candidates, pocket.inners, BooleanOp::DIFFERENCE, options);
            for (const auto& group : forest) {
                nextOuters.push_back(group.outer);
            }
        } else {
            nextOuters = candidates;
        }

        if (nextOuters.empty()) {
            tree.lock(*leaf);
        } else {
            tree.branch(*leaf, nextOuters);
        }
    }

    return tree;
}

std::vector<FillSequence> ContourFill::fillPocket(const PathFace& pocket,
                                                  double stepover,
                                                  const PolygonOps::OffsetOptions& options) {
    BranchTree<Polygon> tree = buildTree(pocket, stepover, options);

    std::vector<FillSequence> sequences;
    for (const auto& polygons : tree.valueSequences()) {
        sequences.emplace_back(pocket.depth, polygons);
    }

    std::cout << "DEBUG: Pocket at depth " << pocket.depth << " filled with " << tree.size()
              << " contours in " << sequences.size() << " sequences" << std::endl;
    return sequences;
}

} // namespace cam
} // namespace kerf
