#include "core/geometry.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace kerf {
namespace cam {

namespace {

// Loop vertices without the repeated closing point
std::vector<Point2D> uniqueVertices(const std::vector<Point2D>& points) {
    std::vector<Point2D> vertices(points);
    if (vertices.size() > 1 && vertices.front() == vertices.back()) {
        vertices.pop_back();
    }
    return vertices;
}

Point2D closestOnSegment(const Point2D& p, const Point2D& a, const Point2D& b) {
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    double lengthSquared = dx * dx + dy * dy;
    if (lengthSquared == 0.0) {
        return a;
    }

    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lengthSquared;
    t = std::max(0.0, std::min(1.0, t));
    return Point2D(a.x + t * dx, a.y + t * dy);
}

} // namespace

bool Polygon::isClosed() const {
    return m_points.size() > 1 && m_points.front() == m_points.back();
}

void Polygon::close() {
    if (!m_points.empty() && !isClosed()) {
        m_points.push_back(m_points.front());
    }
}

double Polygon::signedArea() const {
    if (m_points.size() < 3) {
        return 0.0;
    }

    // Shoelace formula
    double area = 0.0;
    size_t j = m_points.size() - 1;

    for (size_t i = 0; i < m_points.size(); i++) {
        area += (m_points[j].x + m_points[i].x) * (m_points[i].y - m_points[j].y);
        j = i;
    }

    return area / 2.0;
}

double Polygon::area() const {
    return std::abs(signedArea());
}

bool Polygon::isClockwise() const {
    return signedArea() < 0.0;
}

void Polygon::reverse() {
    std::reverse(m_points.begin(), m_points.end());
}

double Polygon::length() const {
    if (m_points.size() < 2) {
        return 0.0;
    }

    double totalLength = 0.0;
    for (size_t i = 1; i < m_points.size(); ++i) {
        totalLength += m_points[i-1].distanceTo(m_points[i]);
    }

    if (!isClosed()) {
        totalLength += m_points.back().distanceTo(m_points.front());
    }

    return totalLength;
}

void Polygon::getBounds(double& minX, double& minY, double& maxX, double& maxY) const {
    if (m_points.empty()) {
        minX = minY = maxX = maxY = 0.0;
        return;
    }

    minX = maxX = m_points[0].x;
    minY = maxY = m_points[0].y;

    for (const auto& point : m_points) {
        minX = std::min(minX, point.x);
        minY = std::min(minY, point.y);
        maxX = std::max(maxX, point.x);
        maxY = std::max(maxY, point.y);
    }
}

Point2D Polygon::nearestPoint(const Point2D& point, size_t& segmentIndex) const {
    std::vector<Point2D> vertices = uniqueVertices(m_points);
    segmentIndex = 0;

    if (vertices.empty()) {
        return point;
    }
    if (vertices.size() == 1) {
        return vertices[0];
    }

    double bestDistance = std::numeric_limits<double>::max();
    Point2D best = vertices[0];

    for (size_t i = 0; i < vertices.size(); ++i) {
        const Point2D& a = vertices[i];
        const Point2D& b = vertices[(i + 1) % vertices.size()];
        Point2D candidate = closestOnSegment(point, a, b);
        double distance = candidate.distanceTo(point);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = candidate;
            segmentIndex = i;
        }
    }

    return best;
}

Polygon Polygon::rotatedToStart(const Point2D& start, size_t segmentIndex) const {
    std::vector<Point2D> vertices = uniqueVertices(m_points);
    Polygon rotated;
    rotated.addPoint(start);

    for (size_t offset = 1; offset <= vertices.size(); ++offset) {
        const Point2D& vertex = vertices[(segmentIndex + offset) % vertices.size()];
        if (vertex != start) {
            rotated.addPoint(vertex);
        }
    }

    rotated.addPoint(start);
    return rotated;
}

PathFace PathFace::fromLoops(const std::vector<std::vector<Point3D>>& loops) {
    if (loops.empty() || loops.front().size() < 3) {
        throw std::invalid_argument("Face requires an outer loop with at least three points");
    }

    const double depth = loops.front().front().z;
    const double flatTolerance = 1e-6;

    PathFace face;
    face.depth = depth;

    for (size_t loopIndex = 0; loopIndex < loops.size(); ++loopIndex) {
        Polygon polygon;
        for (const auto& vertex : loops[loopIndex]) {
            if (std::fabs(vertex.z - depth) > flatTolerance) {
                throw std::invalid_argument("Face is not flat");
            }
            polygon.addPoint(vertex.xy());
        }
        polygon.close();

        if (loopIndex == 0) {
            face.outer = polygon;
        } else {
            face.inners.push_back(polygon);
        }
    }

    if (depth > flatTolerance) {
        throw std::invalid_argument("Face is above job plane");
    }

    return face;
}

} // namespace cam
} // namespace kerf
