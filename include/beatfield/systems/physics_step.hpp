/**
 * @file physics_step.hpp
 * @brief Per-frame particle integrator
 *
 * Each frame the quad-tree is rebuilt from the current particle positions,
 * then every particle in turn runs the full sequence:
 *  - audio bounce (only while audio-responsive)
 *  - gravity, drag and position integration
 *  - overlap resolution against neighbours from the quad-tree
 *  - wall, floor and ceiling reflection
 *
 * Required components:
 * - Position, Velocity, Mass, Radius, Category, FloorLevel, BounceEnergy
 *
 * Reads SimulatorState and AudioState from the simulator-state entity.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "beatfield/spatial/quad_tree.hpp"
#include "beatfield/systems/i_system.hpp"
#include "beatfield/systems/physics_config.hpp"

namespace Systems {

class PhysicsStepSystem : public ConfigurableSystem<PhysicsConfig> {
public:
    PhysicsStepSystem();

    void update(entt::registry& registry) override;

    /**
     * @throws std::invalid_argument for out-of-range world or tree parameters
     */
    void setSystemConfig(const SystemConfig& config) override;

    /**
     * @throws std::invalid_argument for out-of-range physics tunables
     */
    void setPhysicsConfig(const PhysicsConfig& config);

    /**
     * @brief Frame time actually simulated for a requested dt
     *
     * Negative and non-finite values become 0; anything above
     * SystemConfig::MaxFrameSeconds is clamped to it.
     */
    double clampFrameSeconds(double dt) const;

    /// The tree built during the last update, for the debug overlay
    const Spatial::QuadTree& getSpatialIndex() const;

    std::size_t droppedLastFrame() const { return droppedInserts; }
    std::size_t collisionsLastFrame() const { return collisionPairs; }

private:
    void rebuildIndex(entt::registry& registry);

    std::unique_ptr<Spatial::QuadTree> index;
    std::vector<entt::entity> neighbors;
    std::size_t droppedInserts = 0;
    std::size_t collisionPairs = 0;
};

} // namespace Systems
