#include "beatfield/systems/boundary.hpp"

namespace Systems {

bool BoundaryResolver::resolve(Components::Position& pos,
                               Components::Velocity& vel,
                               double radius,
                               double floorY,
                               double worldWidth,
                               const PhysicsConfig& config)
{
    bool hit = false;

    if (pos.x - radius < 0.0) {
        pos.x = radius;
        vel.x = -vel.x * config.WallDamping;
        hit = true;
    } else if (pos.x + radius > worldWidth) {
        pos.x = worldWidth - radius;
        vel.x = -vel.x * config.WallDamping;
        hit = true;
    }

    if (pos.y + radius > floorY) {
        pos.y = floorY - radius;
        vel.y = -vel.y * config.FloorDamping;
        hit = true;
    }

    if (pos.y - radius < 0.0) {
        pos.y = radius;
        vel.y = -vel.y * config.CeilingDamping;
        hit = true;
    }

    return hit;
}

} // namespace Systems
