/**
 * @file boundary.hpp
 * @brief Walls, per-particle floor and ceiling (stage h)
 */

#pragma once

#include "beatfield/components/basic.hpp"
#include "beatfield/systems/physics_config.hpp"

namespace Systems {

/**
 * @class BoundaryResolver
 * @brief Reflects and clamps a particle against the world edges
 *
 * Walls and the ceiling reflect with PhysicsConfig::WallDamping and
 * CeilingDamping; the particle's own floor level reflects with the stronger
 * FloorDamping. The floor is checked before the ceiling. A reflected particle
 * is placed exactly on the boundary it crossed.
 */
class BoundaryResolver {
public:
    /**
     * @return true if any boundary was hit
     */
    static bool resolve(Components::Position& pos,
                        Components::Velocity& vel,
                        double radius,
                        double floorY,
                        double worldWidth,
                        const PhysicsConfig& config);
};

} // namespace Systems
