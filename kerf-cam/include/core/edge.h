#ifndef KERF_CAM_EDGE_H
#define KERF_CAM_EDGE_H

#include "core/geometry.h"
#include <memory>
#include <string>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Geometry kinds an edge can carry
 */
enum class EdgeType {
    Line,
    Circle,     // Arc or full circle
    Ellipse,
    Bezier,
    BSpline,
    Offset      // Another edge shifted sideways in XY
};

std::string edgeTypeName(EdgeType type);

/**
 * A parametric curve segment with an orientation flag.
 * Start, end and positionAt follow the orientation, so a reversed edge
 * runs from its natural end back to its natural start.
 */
class Edge {
public:
    static Edge line(const Point3D& start, const Point3D& end);

    /**
     * Circular arc around an axis parallel to Z. Angles are measured in the
     * plane of the circle, counter-clockwise about its normal.
     * @param center Arc center
     * @param radius Arc radius
     * @param startAngle Start angle in radians
     * @param endAngle End angle in radians, greater than startAngle (startAngle + 2*pi for a full circle)
     * @param normalZ Z component of the circle normal
     * @return The arc edge
     */
    static Edge circle(const Point3D& center, double radius,
                       double startAngle, double endAngle, double normalZ = 1.0);

    static Edge ellipse(const Point3D& center, double majorRadius, double minorRadius,
                        double startAngle, double endAngle);

    // Bezier curve through its first and last pole
    static Edge bezier(const std::vector<Point3D>& poles);

    // Clamped uniform B-spline
    static Edge bspline(const std::vector<Point3D>& poles, int degree = 3);

    // Basis edge shifted by distance to the right of its direction of travel
    static Edge offset(const Edge& basis, double distance);

    // Same curve traversed the other way
    Edge reversed() const;

    // Same edge moved along Z
    Edge translated(double dz) const;

    EdgeType getType() const { return m_type; }
    bool isReversed() const { return m_reversed; }
    double getNormalZ() const { return m_normalZ; }

    Point3D startPoint() const { return positionAt(0.0); }
    Point3D endPoint() const { return positionAt(1.0); }

    // Point at normalized parameter t in [0, 1] along the oriented edge
    Point3D positionAt(double t) const;

    double length() const;

    // Center of a circle edge
    Point3D arcCenter() const;

    // True when a circle edge closes on itself
    bool isFullCircle() const;

    /**
     * Direction of a circle edge as seen from +Z.
     * Throws std::runtime_error for non-circle edges and for arcs whose normal has no Z component.
     */
    bool isClockwise() const;

private:
    explicit Edge(EdgeType type);

    Point3D naturalPosition(double u) const;
    Point3D tangentAt(double u) const;

    EdgeType m_type;
    bool m_reversed;

    std::vector<Point3D> m_points;  // Line end points or curve poles
    Point3D m_center;
    double m_radius;
    double m_minorRadius;
    double m_startAngle;
    double m_endAngle;
    double m_normalZ;
    int m_degree;
    double m_offsetDistance;
    std::shared_ptr<const Edge> m_basis;
};

/**
 * An ordered chain of edges, each starting where the previous one ends
 */
class Wire {
public:
    Wire() = default;
    explicit Wire(const std::vector<Edge>& edges) : m_edges(edges) {}

    void addEdge(const Edge& edge) {
        m_edges.push_back(edge);
    }

    const std::vector<Edge>& getEdges() const {
        return m_edges;
    }

    bool empty() const {
        return m_edges.empty();
    }

    Point3D startPoint() const;
    Point3D endPoint() const;
    bool isClosed() const;
    double length() const;

    // Same wire moved along Z
    Wire translated(double dz) const;

    /**
     * Flatten the wire into points. Lines contribute their end points, curves
     * are split into max(length / precision, 2) straight segments.
     * Throws std::runtime_error when the wire collapses to a single point.
     * @param precision Target segment length for curves
     * @param close Repeat the first point at the end when the wire is open
     * @return Points from the wire start to its end
     */
    std::vector<Point3D> toVectors(double precision = 0.1, bool close = false) const;

    // Closed wire of line edges through the polygon vertices at height z
    static Wire fromPolygon(const Polygon& polygon, double z);

private:
    std::vector<Edge> m_edges;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_EDGE_H
