#include "core/edge.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace kerf {
namespace cam {

namespace {

const double PI = 3.14159265358979323846;
const int LENGTH_SAMPLES = 256;

Point3D deCasteljau(std::vector<Point3D> points, double u) {
    for (size_t level = points.size(); level > 1; --level) {
        for (size_t i = 0; i + 1 < level; ++i) {
            points[i] = points[i] * (1.0 - u) + points[i + 1] * u;
        }
    }
    return points.front();
}

// de Boor evaluation on a clamped uniform knot vector
Point3D deBoor(const std::vector<Point3D>& poles, int degree, double u) {
    const int n = static_cast<int>(poles.size()) - 1;
    const int p = std::min(degree, n);
    const int spans = n - p + 1;

    std::vector<double> knots;
    for (int i = 0; i <= p; ++i) knots.push_back(0.0);
    for (int i = 1; i < spans; ++i) knots.push_back(static_cast<double>(i) / spans);
    for (int i = 0; i <= p; ++i) knots.push_back(1.0);

    int k = p;
    while (k < n && u >= knots[k + 1]) {
        ++k;
    }

    std::vector<Point3D> d;
    for (int j = 0; j <= p; ++j) {
        d.push_back(poles[j + k - p]);
    }

    for (int r = 1; r <= p; ++r) {
        for (int j = p; j >= r; --j) {
            double denominator = knots[j + 1 + k - r] - knots[j + k - p];
            double alpha = denominator == 0.0 ? 0.0 : (u - knots[j + k - p]) / denominator;
            d[j] = d[j - 1] * (1.0 - alpha) + d[j] * alpha;
        }
    }

    return d[p];
}

} // namespace

std::string edgeTypeName(EdgeType type) {
    switch (type) {
        case EdgeType::Line: return "LINE";
        case EdgeType::Circle: return "CIRCLE";
        case EdgeType::Ellipse: return "ELLIPSE";
        case EdgeType::Bezier: return "BEZIER";
        case EdgeType::BSpline: return "BSPLINE";
        case EdgeType::Offset: return "OFFSET";
    }
    return "UNKNOWN";
}

// ================================
// Edge
// ================================

Edge::Edge(EdgeType type)
    : m_type(type)
    , m_reversed(false)
    , m_radius(0.0)
    , m_minorRadius(0.0)
    , m_startAngle(0.0)
    , m_endAngle(0.0)
    , m_normalZ(1.0)
    , m_degree(0)
    , m_offsetDistance(0.0)
{}

Edge Edge::line(const Point3D& start, const Point3D& end) {
    Edge edge(EdgeType::Line);
    edge.m_points = {start, end};
    return edge;
}

Edge Edge::circle(const Point3D& center, double radius,
                  double startAngle, double endAngle, double normalZ) {
    if (radius <= 0.0) {
        throw std::invalid_argument("Circle radius must be greater than zero");
    }
    if (endAngle <= startAngle) {
        throw std::invalid_argument("Circle end angle must be greater than its start angle");
    }

    Edge edge(EdgeType::Circle);
    edge.m_center = center;
    edge.m_radius = radius;
    edge.m_startAngle = startAngle;
    edge.m_endAngle = endAngle;
    edge.m_normalZ = normalZ;
    return edge;
}

Edge Edge::ellipse(const Point3D& center, double majorRadius, double minorRadius,
                   double startAngle, double endAngle) {
    Edge edge(EdgeType::Ellipse);
    edge.m_center = center;
    edge.m_radius = majorRadius;
    edge.m_minorRadius = minorRadius;
    edge.m_startAngle = startAngle;
    edge.m_endAngle = endAngle;
    return edge;
}

Edge Edge::bezier(const std::vector<Point3D>& poles) {
    if (poles.size() < 2) {
        throw std::invalid_argument("Bezier edge needs at least two poles");
    }

    Edge edge(EdgeType::Bezier);
    edge.m_points = poles;
    return edge;
}

Edge Edge::bspline(const std::vector<Point3D>& poles, int degree) {
    if (poles.size() < 2 || degree < 1) {
        throw std::invalid_argument("B-spline edge needs at least two poles and a positive degree");
    }

    Edge edge(EdgeType::BSpline);
    edge.m_points = poles;
    edge.m_degree = degree;
    return edge;
}

Edge Edge::offset(const Edge& basis, double distance) {
    Edge edge(EdgeType::Offset);
    edge.m_basis = std::make_shared<const Edge>(basis);
    edge.m_offsetDistance = distance;
    return edge;
}

Edge Edge::reversed() const {
    Edge edge = *this;
    edge.m_reversed = !m_reversed;
    return edge;
}

Edge Edge::translated(double dz) const {
    Edge edge = *this;
    const Point3D shift(0.0, 0.0, dz);
    for (auto& point : edge.m_points) {
        point = point + shift;
    }
    edge.m_center = m_center + shift;
    if (m_basis) {
        edge.m_basis = std::make_shared<const Edge>(m_basis->translated(dz));
    }
    return edge;
}

Point3D Edge::naturalPosition(double u) const {
    switch (m_type) {
        case EdgeType::Line:
            return m_points[0] + (m_points[1] - m_points[0]) * u;

        case EdgeType::Circle: {
            double angle = m_startAngle + (m_endAngle - m_startAngle) * u;
            // A circle around -Z runs clockwise as seen from above
            double side = m_normalZ < 0.0 ? -1.0 : 1.0;
            return Point3D(m_center.x + m_radius * std::cos(angle),
                           m_center.y + side * m_radius * std::sin(angle),
                           m_center.z);
        }

        case EdgeType::Ellipse: {
            double angle = m_startAngle + (m_endAngle - m_startAngle) * u;
            return Point3D(m_center.x + m_radius * std::cos(angle),
                           m_center.y + m_minorRadius * std::sin(angle),
                           m_center.z);
        }

        case EdgeType::Bezier:
            return deCasteljau(m_points, u);

        case EdgeType::BSpline:
            return deBoor(m_points, m_degree, u);

        case EdgeType::Offset: {
            Point3D base = m_basis->positionAt(u);
            Point3D tangent = tangentAt(u);
            double norm = std::sqrt(tangent.x * tangent.x + tangent.y * tangent.y);
            if (norm == 0.0) {
                return base;
            }
            // Right hand side of the direction of travel
            return Point3D(base.x + m_offsetDistance * tangent.y / norm,
                           base.y - m_offsetDistance * tangent.x / norm,
                           base.z);
        }
    }

    throw std::runtime_error("Unsupported geom type: " + edgeTypeName(m_type));
}

Point3D Edge::tangentAt(double u) const {
    const double h = 1e-6;
    double u0 = std::max(0.0, u - h);
    double u1 = std::min(1.0, u + h);
    return m_basis->positionAt(u1) - m_basis->positionAt(u0);
}

Point3D Edge::positionAt(double t) const {
    t = std::max(0.0, std::min(1.0, t));
    return naturalPosition(m_reversed ? 1.0 - t : t);
}

double Edge::length() const {
    if (m_type == EdgeType::Line) {
        return m_points[0].distanceTo(m_points[1]);
    }
    if (m_type == EdgeType::Circle) {
        return m_radius * std::fabs(m_endAngle - m_startAngle);
    }

    double total = 0.0;
    Point3D previous = naturalPosition(0.0);
    for (int i = 1; i <= LENGTH_SAMPLES; ++i) {
        Point3D current = naturalPosition(static_cast<double>(i) / LENGTH_SAMPLES);
        total += previous.distanceTo(current);
        previous = current;
    }
    return total;
}

Point3D Edge::arcCenter() const {
    if (m_type != EdgeType::Circle && m_type != EdgeType::Ellipse) {
        throw std::runtime_error("Edge has no center: " + edgeTypeName(m_type));
    }
    return m_center;
}

bool Edge::isFullCircle() const {
    return m_type == EdgeType::Circle &&
           std::fabs(std::fabs(m_endAngle - m_startAngle) - 2.0 * PI) < 1e-9;
}

bool Edge::isClockwise() const {
    if (m_type != EdgeType::Circle) {
        throw std::runtime_error("Only circle edges have a direction");
    }
    if (m_normalZ == 0.0) {
        throw std::runtime_error("Only Z axis arcs are supported");
    }

    return (m_normalZ < 0.0) != m_reversed;
}

// ================================
// Wire
// ================================

Point3D Wire::startPoint() const {
    if (m_edges.empty()) {
        throw std::runtime_error("Empty wire has no start point");
    }
    return m_edges.front().startPoint();
}

Point3D Wire::endPoint() const {
    if (m_edges.empty()) {
        throw std::runtime_error("Empty wire has no end point");
    }
    return m_edges.back().endPoint();
}

bool Wire::isClosed() const {
    return !m_edges.empty() && startPoint() == endPoint();
}

double Wire::length() const {
    double total = 0.0;
    for (const auto& edge : m_edges) {
        total += edge.length();
    }
    return total;
}

Wire Wire::translated(double dz) const {
    Wire wire;
    for (const auto& edge : m_edges) {
        wire.addEdge(edge.translated(dz));
    }
    return wire;
}

std::vector<Point3D> Wire::toVectors(double precision, bool close) const {
    if (precision <= 0.0) {
        throw std::invalid_argument("Interpolation precision must be greater than zero");
    }

    std::vector<Point3D> vectors;
    if (m_edges.empty()) {
        return vectors;
    }

    // Repeated points carry no motion
    auto append = [&vectors](const Point3D& point) {
        if (vectors.empty() || vectors.back() != point) {
            vectors.push_back(point);
        }
    };

    append(startPoint());
    for (const auto& edge : m_edges) {
        if (edge.getType() == EdgeType::Line) {
            append(edge.endPoint());
            continue;
        }

        int segments = std::max(static_cast<int>(edge.length() / precision), 2);
        for (int i = 1; i <= segments; ++i) {
            append(edge.positionAt(static_cast<double>(i) / segments));
        }
    }

    if (close && vectors.front() != vectors.back()) {
        vectors.push_back(vectors.front());
    }

    if (vectors.size() == 1) {
        throw std::runtime_error("Wire collapsed to a single vector");
    }

    return vectors;
}

Wire Wire::fromPolygon(const Polygon& polygon, double z) {
    Wire wire;
    const auto& points = polygon.getPoints();
    for (size_t i = 1; i < points.size(); ++i) {
        wire.addEdge(Edge::line(Point3D(points[i - 1], z), Point3D(points[i], z)));
    }

    if (!polygon.isClosed() && points.size() > 2) {
        wire.addEdge(Edge::line(Point3D(points.back(), z), Point3D(points.front(), z)));
    }

    return wire;
}

} // namespace cam
} // namespace kerf
