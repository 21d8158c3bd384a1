/**
 * @file region.hpp
 * @brief Axis-aligned rectangle used as quad-tree cell and query window
 */

#pragma once

#include <array>
#include "beatfield/math/vector_math.hpp"

namespace Spatial {

/**
 * @brief Child slot order used by subdivision, insertion and queries.
 */
enum class Quadrant {
    NW = 0,
    NE = 1,
    SW = 2,
    SE = 3
};

/**
 * @class Region
 * @brief Rectangle described by its centre and full extents (w, h).
 *
 * Containment is half-open on both axes: x in [minX, maxX), y in [minY, maxY).
 * The bounds are stored rather than recomputed from the centre, and split()
 * hands the same midpoint value to both sides of each cut, so the four
 * quadrants tile the parent exactly with no gap or overlap.
 */
class Region {
public:
    Region();

    /**
     * @param centerX Centre x
     * @param centerY Centre y
     * @param width Full width (w); the half-extent is w/2
     * @param height Full height (h); the half-extent is h/2
     */
    Region(double centerX, double centerY, double width, double height);

    static Region fromBounds(double minX, double minY, double maxX, double maxY);

    double getMinX() const { return minX; }
    double getMinY() const { return minY; }
    double getMaxX() const { return maxX; }
    double getMaxY() const { return maxY; }
    double centerX() const;
    double centerY() const;
    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }

    /**
     * @brief Half-open point containment test
     */
    bool contains(double x, double y) const;
    bool contains(const Position& p) const { return contains(p.x, p.y); }

    /**
     * @brief Separating-axis overlap test; touching edges count as
     *        intersecting.
     */
    bool intersects(const Region& other) const;

    /**
     * @brief The four quadrants, indexed by Quadrant.
     */
    std::array<Region, 4> split() const;

    Region quadrant(Quadrant q) const;

private:
    double minX;
    double minY;
    double maxX;
    double maxY;
};

} // namespace Spatial
