#include "core/router.h"
#include <cmath>
#include <stdexcept>

namespace kerf {
namespace cam {

Router::Router(const RouteOptions& options)
    : m_options(options) {}

Command Router::cutTo(const Point3D& target) const {
    Command command = Command::abs(CommandKind::Cut, target.x, target.y, target.z);
    if (m_options.feed) {
        command = command.withFeed(*m_options.feed);
    }
    return command;
}

Command Router::plungeTo(double z) const {
    Command command = Command::plunge(z);
    if (m_options.plungeFeed) {
        command = command.withFeed(*m_options.plungeFeed);
    }
    return command;
}

std::vector<Command> Router::rapidTo(const Point3D& target) const {
    std::vector<Command> commands;
    commands.push_back(Command::retract(m_options.rapidHeight));
    commands.push_back(Command::abs(CommandKind::Rapid, target.x, target.y));

    if (m_options.safePlungeHeight) {
        double safeHeight = *m_options.safePlungeHeight;
        commands.push_back(Command::abs(CommandKind::Rapid, std::nullopt, std::nullopt, safeHeight));
        if (safeHeight > target.z) {
            commands.push_back(plungeTo(target.z));
        }
    } else {
        commands.push_back(plungeTo(target.z));
    }

    return commands;
}

std::vector<Command> Router::routeSequence(const FillSequence& sequence) {
    std::vector<Command> commands;
    const double depth = sequence.depth;

    for (const auto& polygon : sequence.polygons) {
        if (polygon.size() < 2) {
            continue;
        }

        Polygon loop = polygon;
        bool bridged = false;

        if (m_options.stepover && m_cursor && std::fabs(m_cursor->z - depth) < 1e-9) {
            size_t segmentIndex = 0;
            Point2D nearest = polygon.nearestPoint(m_cursor->xy(), segmentIndex);
            if (nearest.distanceTo(m_cursor->xy()) <= *m_options.stepover) {
                commands.push_back(cutTo(Point3D(nearest, depth)));
                loop = polygon.rotatedToStart(nearest, segmentIndex);
                bridged = true;
            }
        }

        const auto& points = loop.getPoints();
        if (!bridged) {
            auto transition = rapidTo(Point3D(points.front(), depth));
            commands.insert(commands.end(), transition.begin(), transition.end());
        }

        // A rotated loop finishes on its bridge point
        for (size_t i = 1; i < points.size(); ++i) {
            commands.push_back(cutTo(Point3D(points[i], depth)));
        }

        m_cursor = Point3D(points.back(), depth);
    }

    return commands;
}

std::vector<Command> Router::routeWires(const std::vector<Wire>& wires) {
    std::vector<Command> commands;

    for (const auto& wire : wires) {
        if (wire.empty()) {
            continue;
        }

        Point3D start = wire.startPoint();
        if (m_cursor &&
            std::fabs(m_cursor->x - start.x) <= m_options.directPlungeTolerance &&
            std::fabs(m_cursor->y - start.y) <= m_options.directPlungeTolerance) {
            commands.push_back(plungeTo(start.z));
        } else {
            auto transition = rapidTo(start);
            commands.insert(commands.end(), transition.begin(), transition.end());
        }

        for (const auto& edge : wire.getEdges()) {
            routeEdge(edge, commands);
        }

        m_cursor = wire.endPoint();
    }

    return commands;
}

void Router::routeEdge(const Edge& edge, std::vector<Command>& commands) const {
    switch (edge.getType()) {
        case EdgeType::Line:
            commands.push_back(cutTo(edge.endPoint()));
            return;

        case EdgeType::Circle: {
            CommandKind kind = edge.isClockwise() ? CommandKind::CircularCW : CommandKind::CircularCCW;
            Point3D center = edge.arcCenter();
            CommandVector centerVector(center.x, center.y, std::nullopt);

            std::vector<Command> arcs;
            if (edge.isFullCircle()) {
                // A single 360 degree arc has no unique end point, cut two halves
                arcs.push_back(Command::arc(kind, CommandVector::absolute(edge.positionAt(0.5)),
                                            centerVector, CommandVector::absolute(edge.positionAt(0.25))));
                arcs.push_back(Command::arc(kind, CommandVector::absolute(edge.endPoint()),
                                            centerVector, CommandVector::absolute(edge.positionAt(0.75))));
            } else {
                arcs.push_back(Command::arc(kind, CommandVector::absolute(edge.endPoint()),
                                            centerVector, CommandVector::absolute(edge.positionAt(0.5))));
            }

            for (const auto& arc : arcs) {
                commands.push_back(m_options.feed ? arc.withFeed(*m_options.feed) : arc);
            }
            return;
        }

        case EdgeType::Bezier:
        case EdgeType::BSpline:
        case EdgeType::Offset: {
            // Curves are cut as line segments, the start is the current position
            std::vector<Point3D> vectors = Wire({edge}).toVectors(m_options.interpolationPrecision);
            for (size_t i = 1; i < vectors.size(); ++i) {
                commands.push_back(cutTo(vectors[i]));
            }
            return;
        }

        case EdgeType::Ellipse:
            break;
    }

    throw std::runtime_error("Unsupported geom type: " + edgeTypeName(edge.getType()));
}

} // namespace cam
} // namespace kerf
