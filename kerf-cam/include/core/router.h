#ifndef KERF_CAM_ROUTER_H
#define KERF_CAM_ROUTER_H

#include "core/command.h"
#include "core/contour_fill.h"
#include "core/edge.h"
#include <optional>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Turns contours and wires into motion commands.
 *
 * The router remembers where the last routed path ended, so consecutive
 * calls are stitched together: a contour within one stepover of the tool is
 * entered with a short in-plane cut instead of a retract.
 */
class Router {
public:
    /**
     * Options for routing
     */
    struct RouteOptions {
        double rapidHeight;                      // Travel height between paths
        std::optional<double> safePlungeHeight;  // Rapid down to this height before plunging
        std::optional<double> stepover;          // Bridge distance for contour sequences
        std::optional<double> feed;              // Feed rate for cuts
        std::optional<double> plungeFeed;        // Feed rate for plunges
        double interpolationPrecision;           // Segment length for interpolated curves
        double directPlungeTolerance;            // XY distance allowing a direct plunge between wires

        RouteOptions()
            : rapidHeight(10.0)
            , interpolationPrecision(0.1)
            , directPlungeTolerance(0.001)
        {}
    };

    explicit Router(const RouteOptions& options = RouteOptions());

    const RouteOptions& getOptions() const { return m_options; }

    // Position where the last routed path ended, if any
    const std::optional<Point3D>& getCursor() const { return m_cursor; }
    void setCursor(const Point3D& position) { m_cursor = position; }

    /**
     * Retract, travel above target and plunge down to it
     */
    std::vector<Command> rapidTo(const Point3D& target) const;

    /**
     * Route every contour of a fill sequence at the sequence depth
     * @param sequence Contours to cut, in order
     * @return Commands cutting the whole sequence
     */
    std::vector<Command> routeSequence(const FillSequence& sequence);

    /**
     * Route wires edge by edge, keeping their direction.
     * Throws std::runtime_error for edge types that cannot be cut.
     * @param wires Tool centre wires, in cutting order
     * @return Commands cutting all wires
     */
    std::vector<Command> routeWires(const std::vector<Wire>& wires);

private:
    Command cutTo(const Point3D& target) const;
    Command plungeTo(double z) const;
    void routeEdge(const Edge& edge, std::vector<Command>& commands) const;

    RouteOptions m_options;
    std::optional<Point3D> m_cursor;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_ROUTER_H
