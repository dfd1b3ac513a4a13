#ifndef KERF_CAM_STEPDOWN_H
#define KERF_CAM_STEPDOWN_H

#include "core/contour_fill.h"
#include "core/geometry.h"
#include <vector>

namespace kerf {
namespace cam {

/**
 * Splits the depth of a pocket into passes no deeper than the stepdown
 */
class StepdownScheduler {
public:
    /**
     * @param stepdown Maximum depth of one pass, must be positive
     * @param maxStepdownCount Upper bound on the number of intermediate passes
     */
    explicit StepdownScheduler(double stepdown, int maxStepdownCount = 100);

    double getStepdown() const { return m_stepdown; }
    int getMaxStepdownCount() const { return m_maxStepdownCount; }

    /**
     * Intermediate pass depths from startDepth down to, but excluding, bottomDepth.
     * Throws std::runtime_error when more than the maximum number of passes is needed.
     */
    std::vector<double> depthSeries(double startDepth, double bottomDepth) const;

    /**
     * Depth of the first pass of a pocket.
     * A pocket lying inside an already processed pocket that is not deeper starts
     * one stepdown below the deepest such pocket, any other pocket one stepdown
     * below the top plane.
     * @param pocket Pocket to schedule
     * @param processed Pockets scheduled before this one
     * @return Depth of the first pass
     */
    double startDepth(const PathFace& pocket, const std::vector<PathFace>& processed) const;

    /**
     * Copy fill sequences onto every intermediate pass, one pass after another.
     * The sequences at their own depth are not included.
     * @param sequences Sequences sharing a single depth
     * @param startDepth Depth of the first pass
     * @return Copies ordered shallowest pass first
     */
    std::vector<FillSequence> expand(const std::vector<FillSequence>& sequences, double startDepth) const;

private:
    double m_stepdown;
    int m_maxStepdownCount;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_STEPDOWN_H
