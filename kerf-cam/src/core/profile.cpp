#include "core/profile.h"
#include "core/polygon_ops.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace kerf {
namespace cam {

Router::RouteOptions ProfileOperation::routeOptions(const JobSettings& settings) {
    Router::RouteOptions options;
    options.rapidHeight = settings.getRapidHeight();
    options.safePlungeHeight = settings.getOpSafeHeight();
    options.feed = settings.feed;
    options.plungeFeed = settings.getPlungeFeed();
    return options;
}

std::vector<Wire> ProfileOperation::stepdownLayers(const Wire& base,
                                                   std::optional<double> stepdown,
                                                   int maxStepdownCount) {
    std::vector<Wire> layers;
    layers.push_back(base);

    if (stepdown) {
        if (*stepdown <= 0.0) {
            throw std::invalid_argument("Stepdown must be greater than zero");
        }

        const double baseZ = base.startPoint().z;
        for (int i = 0;; ++i) {
            if (i > maxStepdownCount) {
                throw std::runtime_error("Profile max stepdown count exceeded");
            }

            double shift = *stepdown * (i + 1);
            // Passes at or above the job plane cut nothing
            if (baseZ + shift >= -0.001) {
                break;
            }
            layers.push_back(base.translated(shift));
        }

        std::reverse(layers.begin(), layers.end());
    }

    return layers;
}

std::vector<Command> ProfileOperation::generate(const JobSettings& settings,
                                                const std::vector<PathFace>& faces,
                                                const ProfileParams& params) {
    const double toolRadius = settings.requireToolRadius("Profile");
    if (!params.outerOffset && !params.innerOffset) {
        throw std::invalid_argument("Set at least one of outer offset or inner offset");
    }

    std::vector<Wire> toolpaths;
    auto addLoop = [&](const Polygon& loop, double offset, double depth) {
        for (const auto& polygon : PolygonOps::offsetPolygon(loop, offset)) {
            auto layers = stepdownLayers(Wire::fromPolygon(polygon, depth), params.stepdown,
                                         settings.maxStepdownCount);
            toolpaths.insert(toolpaths.end(), layers.begin(), layers.end());
        }
    };

    // Holes first so the part is still held while its outline is cut
    if (params.innerOffset) {
        double offset = calculateOffset(toolRadius, params.innerOffset);
        for (const auto& face : faces) {
            for (const auto& inner : face.inners) {
                addLoop(inner, offset, face.depth);
            }
        }
    }

    if (params.outerOffset) {
        double offset = calculateOffset(toolRadius, params.outerOffset);
        for (const auto& face : faces) {
            addLoop(face.outer, offset, face.depth);
        }
    }

    std::cout << "DEBUG: Profile routes " << toolpaths.size() << " wires" << std::endl;

    Router router(routeOptions(settings));
    return router.routeWires(toolpaths);
}

std::vector<Command> ProfileOperation::generateWires(const JobSettings& settings,
                                                     const std::vector<Wire>& wires,
                                                     std::optional<double> stepdown) {
    std::vector<Wire> toolpaths;
    for (const auto& wire : wires) {
        if (wire.empty()) {
            continue;
        }
        auto layers = stepdownLayers(wire, stepdown, settings.maxStepdownCount);
        toolpaths.insert(toolpaths.end(), layers.begin(), layers.end());
    }

    Router router(routeOptions(settings));
    return router.routeWires(toolpaths);
}

} // namespace cam
} // namespace kerf
