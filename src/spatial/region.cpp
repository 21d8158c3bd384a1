#include "beatfield/spatial/region.hpp"

namespace Spatial {

Region::Region() : minX(0.0), minY(0.0), maxX(0.0), maxY(0.0) {}

Region::Region(double centerX, double centerY, double width, double height)
    : minX(centerX - width / 2.0)
    , minY(centerY - height / 2.0)
    , maxX(centerX + width / 2.0)
    , maxY(centerY + height / 2.0)
{
}

Region Region::fromBounds(double minX, double minY, double maxX, double maxY) {
    Region r;
    r.minX = minX;
    r.minY = minY;
    r.maxX = maxX;
    r.maxY = maxY;
    return r;
}

double Region::centerX() const {
    return (minX + maxX) * 0.5;
}

double Region::centerY() const {
    return (minY + maxY) * 0.5;
}

bool Region::contains(double x, double y) const {
    return x >= minX && x < maxX &&
           y >= minY && y < maxY;
}

bool Region::intersects(const Region& other) const {
    return !(other.minX > maxX ||
             other.maxX < minX ||
             other.minY > maxY ||
             other.maxY < minY);
}

std::array<Region, 4> Region::split() const {
    double const midX = centerX();
    double const midY = centerY();
    // y grows downwards, so "north" is the low-y half
    return {
        fromBounds(minX, minY, midX, midY),  // NW
        fromBounds(midX, minY, maxX, midY),  // NE
        fromBounds(minX, midY, midX, maxY),  // SW
        fromBounds(midX, midY, maxX, maxY)   // SE
    };
}

Region Region::quadrant(Quadrant q) const {
    return split()[static_cast<std::size_t>(q)];
}

} // namespace Spatial
