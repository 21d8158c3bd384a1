/**
 * @file collision.hpp
 * @brief Pairwise overlap resolution between particles (stage g)
 */

#pragma once

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "beatfield/components/basic.hpp"
#include "beatfield/spatial/quad_tree.hpp"
#include "beatfield/systems/physics_config.hpp"

namespace Systems {

/**
 * @brief Mutable view of one side of a colliding pair
 */
struct CollisionBody {
    Components::Position& position;
    Components::Velocity& velocity;
    double mass;
    double radius;
};

/**
 * @class CollisionResolver
 * @brief Pushes overlapping particles apart and applies a repulsion impulse
 *
 * Both particles move half the overlap along the line between their centres.
 * The repulsion impulse falls off as 1/(distance + 1) and is divided by each
 * particle's own mass, so the momentum it adds to the pair sums to zero.
 * Pairs closer than EPSILON have no usable normal; they are split along +x
 * and receive no impulse.
 */
class CollisionResolver {
public:
    /**
     * @return true if the pair overlapped and was resolved
     */
    static bool resolvePair(CollisionBody& a, CollisionBody& b, const PhysicsConfig& config);

    /**
     * @brief Resolves every overlap between `entity` and the neighbours whose
     *        current positions fall in a window around its current position
     * @param scratch Reused buffer for query results
     * @return Number of overlapping pairs resolved
     */
    static std::size_t resolveNeighbors(entt::registry& registry,
                                        entt::entity entity,
                                        const Spatial::QuadTree& index,
                                        const PhysicsConfig& config,
                                        std::vector<entt::entity>& scratch);
};

} // namespace Systems
