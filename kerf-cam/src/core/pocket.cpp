#include "core/pocket.h"
#include "core/depth_compositor.h"
#include "core/polygon_ops.h"
#include "core/router.h"
#include "core/stepdown.h"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace kerf {
namespace cam {

namespace {

void checkBelowJobPlane(const std::vector<PathFace>& faces) {
    for (const auto& face : faces) {
        if (face.depth > 1e-6) {
            throw std::invalid_argument("Face is above job plane");
        }
    }
}

} // namespace

PocketResult PocketOperation::generate(const JobSettings& settings,
                                       const std::vector<PathFace>& opAreas,
                                       const std::vector<PathFace>& avoidAreas,
                                       const PocketParams& params) {
    PocketResult result;

    const double toolRadius = settings.requireToolRadius("Pocket");
    const size_t failedOffsetsBefore = PolygonOps::failedOffsetCount();
    checkBelowJobPlane(opAreas);
    checkBelowJobPlane(avoidAreas);

    // With avoid areas the operation area is usually the stock boundary itself
    const double outerDefault = avoidAreas.empty() ? -1.0 : 0.0;
    const double outerOffset = calculateOffset(toolRadius, params.outerOffset, outerDefault);
    const double innerOffset = calculateOffset(toolRadius, params.innerOffset, 1.0);
    const double avoidOuterOffset = calculateOffset(toolRadius, params.avoidOuterOffset, 1.0);
    const double avoidInnerOffset = calculateOffset(toolRadius, params.avoidInnerOffset, -1.0);
    const double stepover = calculateOffset(toolRadius, params.stepover, 1.5);

    if (stepover <= 0.0) {
        throw std::invalid_argument("Stepover must be greater than zero");
    }

    std::unique_ptr<StepdownScheduler> scheduler;
    if (params.stepdown) {
        scheduler = std::make_unique<StepdownScheduler>(*params.stepdown, settings.maxStepdownCount);
    }

    // Offset faces
    std::vector<PathFace> offsetOpAreas;
    for (const auto& face : opAreas) {
        auto faces = PolygonOps::offsetFace(face, outerOffset, innerOffset);
        offsetOpAreas.insert(offsetOpAreas.end(), faces.begin(), faces.end());
    }

    std::vector<PathFace> offsetAvoidAreas;
    for (const auto& face : avoidAreas) {
        auto faces = PolygonOps::offsetFace(face, avoidOuterOffset, avoidInnerOffset);
        offsetAvoidAreas.insert(offsetAvoidAreas.end(), faces.begin(), faces.end());
    }

    if (offsetOpAreas.empty()) {
        result.warnings.push_back("No pocket area is left after offsetting for the tool");
        result.success = true;
        return result;
    }

    // Build pocket boundaries
    std::vector<DepthLayer> depthLayers = DepthCompositor::compose(offsetOpAreas, offsetAvoidAreas);

    Router::RouteOptions routeOptions;
    routeOptions.rapidHeight = settings.getRapidHeight();
    routeOptions.safePlungeHeight = settings.getOpSafeHeight();
    routeOptions.stepover = stepover;
    routeOptions.feed = settings.feed;
    routeOptions.plungeFeed = settings.getPlungeFeed();
    Router router(routeOptions);
    // Idle above the rapid plane so the first pocket always starts with a full transition
    router.setCursor(Point3D(0.0, 0.0, routeOptions.rapidHeight + 1.0));

    std::vector<PathFace> processed;
    for (const auto& depthLayer : depthLayers) {
        for (const auto& pocket : depthLayer.faces) {
            result.pockets.push_back(pocket);

            // Fill at the pocket depth
            std::vector<FillSequence> sequences = ContourFill::fillPocket(pocket, stepover);
            if (sequences.empty()) {
                result.warnings.push_back("Pocket at depth " + std::to_string(pocket.depth) +
                                          " produced no contours");
                continue;
            }
            result.sequences.insert(result.sequences.end(), sequences.begin(), sequences.end());

            // Repeat on the stepdown passes above the pocket depth
            std::vector<FillSequence> passes;
            if (scheduler) {
                double startDepth = scheduler->startDepth(pocket, processed);
                passes = scheduler->expand(sequences, startDepth);
                result.layers += scheduler->depthSeries(startDepth, pocket.depth).size();
            }
            passes.insert(passes.end(), sequences.begin(), sequences.end());
            result.layers += 1;

            // Route
            for (const auto& pass : passes) {
                auto commands = router.routeSequence(pass);
                result.commands.insert(result.commands.end(), commands.begin(), commands.end());
            }

            processed.push_back(pocket);
        }
    }

    size_t failedOffsets = PolygonOps::failedOffsetCount() - failedOffsetsBefore;
    if (failedOffsets > 0) {
        result.warnings.push_back(std::to_string(failedOffsets) + " offsets failed and were dropped");
    }

    std::cout << "DEBUG: Pocket routed " << result.pockets.size() << " boundaries in "
              << result.layers << " passes (" << result.commands.size() << " commands)" << std::endl;

    result.success = true;
    return result;
}

} // namespace cam
} // namespace kerf
