#ifndef KERF_CAM_GEOMETRY_HPP
#define KERF_CAM_GEOMETRY_HPP

#include <vector>
#include <cmath>
#include <cstddef>

namespace kerf {
namespace cam {

/**
 * Represents a 2D point with x and y coordinates
 */
struct Point2D {
    double x;
    double y;

    Point2D(double _x = 0, double _y = 0) : x(_x), y(_y) {}

    // Calculate distance to another point
    double distanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    // Operators for point manipulation
    Point2D operator+(const Point2D& other) const {
        return Point2D(x + other.x, y + other.y);
    }

    Point2D operator-(const Point2D& other) const {
        return Point2D(x - other.x, y - other.y);
    }

    Point2D operator*(double scalar) const {
        return Point2D(x * scalar, y * scalar);
    }

    bool operator==(const Point2D& other) const {
        // Using small epsilon for floating point comparison
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon;
    }

    bool operator!=(const Point2D& other) const {
        return !(*this == other);
    }
};

/**
 * Represents a 3D position (machine coordinates, Z up, Z = 0 on the job top plane)
 */
struct Point3D {
    double x;
    double y;
    double z;

    Point3D(double _x = 0, double _y = 0, double _z = 0) : x(_x), y(_y), z(_z) {}
    Point3D(const Point2D& p, double _z) : x(p.x), y(p.y), z(_z) {}

    double distanceTo(const Point3D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        double dz = z - other.z;
        return std::sqrt(dx*dx + dy*dy + dz*dz);
    }

    Point2D xy() const {
        return Point2D(x, y);
    }

    Point3D operator+(const Point3D& other) const {
        return Point3D(x + other.x, y + other.y, z + other.z);
    }

    Point3D operator-(const Point3D& other) const {
        return Point3D(x - other.x, y - other.y, z - other.z);
    }

    Point3D operator*(double scalar) const {
        return Point3D(x * scalar, y * scalar, z * scalar);
    }

    bool operator==(const Point3D& other) const {
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon &&
               std::fabs(z - other.z) < epsilon;
    }

    bool operator!=(const Point3D& other) const {
        return !(*this == other);
    }
};

/**
 * Represents a closed polygon for area operations.
 * A closed polygon repeats its first point as its last point.
 */
class Polygon {
public:
    Polygon() = default;
    explicit Polygon(const std::vector<Point2D>& points) : m_points(points) {}

    // Add a point to the polygon
    void addPoint(const Point2D& point) {
        m_points.push_back(point);
    }

    // Get all points
    const std::vector<Point2D>& getPoints() const {
        return m_points;
    }

    // Get a specific point
    const Point2D& getPoint(size_t index) const {
        return m_points.at(index);
    }

    // Get number of points
    size_t size() const {
        return m_points.size();
    }

    // Check if polygon is empty
    bool empty() const {
        return m_points.empty();
    }

    // True when the last point repeats the first
    bool isClosed() const;

    // Repeat the first point at the end if it is not there already
    void close();

    // Calculate the area of the polygon
    double area() const;

    // Signed area, positive for counter-clockwise loops
    double signedArea() const;

    // Check if the polygon is clockwise
    bool isClockwise() const;

    // Reverse the polygon orientation
    void reverse();

    // Perimeter, including the closing segment
    double length() const;

    // Get the bounding box
    void getBounds(double& minX, double& minY, double& maxX, double& maxY) const;

    /**
     * Find the closest point on the outline (not only the closest vertex)
     * @param point Query point
     * @param segmentIndex Receives the index i of the segment [i, i+1] holding the result
     * @return The closest point on the polygon outline
     */
    Point2D nearestPoint(const Point2D& point, size_t& segmentIndex) const;

    /**
     * Re-index the loop so that it starts and ends at a point lying on a segment
     * @param start Point on segment [segmentIndex, segmentIndex + 1]
     * @param segmentIndex Segment holding the start point
     * @return Closed polygon starting and ending at start
     */
    Polygon rotatedToStart(const Point2D& start, size_t segmentIndex) const;

private:
    std::vector<Point2D> m_points;
};

/**
 * A planar region at a fixed depth: material inside outer and outside every inner loop
 */
struct PathFace {
    Polygon outer;
    std::vector<Polygon> inners;
    double depth = 0.0;

    PathFace() = default;
    PathFace(const Polygon& o, const std::vector<Polygon>& i, double d)
        : outer(o), inners(i), depth(d) {}

    /**
     * Build a face from vertex loops. The first loop is the outer boundary.
     * Throws std::invalid_argument when the loops are not flat or lie above Z = 0.
     */
    static PathFace fromLoops(const std::vector<std::vector<Point3D>>& loops);
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_GEOMETRY_HPP
