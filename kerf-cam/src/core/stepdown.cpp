#include "core/stepdown.h"
#include "core/polygon_ops.h"
#include <cmath>
#include <stdexcept>

namespace kerf {
namespace cam {

namespace {
const double DEPTH_EPSILON = 1e-9;
}

StepdownScheduler::StepdownScheduler(double stepdown, int maxStepdownCount)
    : m_stepdown(stepdown), m_maxStepdownCount(maxStepdownCount) {
    if (stepdown <= 0.0) {
        throw std::invalid_argument("Stepdown must be greater than zero");
    }
}

std::vector<double> StepdownScheduler::depthSeries(double startDepth, double bottomDepth) const {
    std::vector<double> depths;

    for (int i = 0;; ++i) {
        double depth = startDepth - i * m_stepdown;
        if (depth <= bottomDepth + DEPTH_EPSILON) {
            break;
        }
        if (i >= m_maxStepdownCount) {
            throw std::runtime_error("Pocket max stepdown count exceeded");
        }
        depths.push_back(depth);
    }

    return depths;
}

double StepdownScheduler::startDepth(const PathFace& pocket, const std::vector<PathFace>& processed) const {
    bool contained = false;
    double containerDepth = 0.0;

    for (const auto& other : processed) {
        if (other.depth < pocket.depth - DEPTH_EPSILON) {
            continue;
        }
        if (!PolygonOps::isPolygonInsideFace(pocket.outer, other)) {
            continue;
        }
        if (!contained || other.depth < containerDepth) {
            containerDepth = other.depth;
            contained = true;
        }
    }

    if (contained) {
        return containerDepth - m_stepdown;
    }
    return -m_stepdown;
}

std::vector<FillSequence> StepdownScheduler::expand(const std::vector<FillSequence>& sequences,
                                                    double startDepth) const {
    std::vector<FillSequence> layers;
    if (sequences.empty()) {
        return layers;
    }

    const double bottomDepth = sequences.front().depth;
    for (const auto& sequence : sequences) {
        if (std::fabs(sequence.depth - bottomDepth) > DEPTH_EPSILON) {
            throw std::invalid_argument("Stepdown sequences must share a single depth");
        }
    }

    for (double depth : depthSeries(startDepth, bottomDepth)) {
        for (const auto& sequence : sequences) {
            layers.emplace_back(depth, sequence.polygons);
        }
    }

    return layers;
}

} // namespace cam
} // namespace kerf
