/**
 * @file physics_step.cpp
 * @brief Implementation of the per-frame particle integrator
 */

#include "beatfield/systems/physics_step.hpp"

#include <algorithm>
#include <cmath>

#include "beatfield/components/basic.hpp"
#include "beatfield/components/sim.hpp"
#include "beatfield/core/debug.hpp"
#include "beatfield/core/profile.hpp"
#include "beatfield/systems/audio_bounce.hpp"
#include "beatfield/systems/boundary.hpp"
#include "beatfield/systems/collision.hpp"

namespace Systems {

namespace {

Spatial::Region worldRegion(const SystemConfig& config) {
    return Spatial::Region::fromBounds(0.0, 0.0, config.WorldWidth, config.WorldHeight);
}

} // namespace

PhysicsStepSystem::PhysicsStepSystem()
    : index(std::make_unique<Spatial::QuadTree>(worldRegion(sysConfig),
                                                sysConfig.QuadTreeCapacity,
                                                sysConfig.QuadTreeMaxDepth))
{
}

void PhysicsStepSystem::setSystemConfig(const SystemConfig& config) {
    validateSystemConfig(config);
    sysConfig = config;
    index = std::make_unique<Spatial::QuadTree>(worldRegion(sysConfig),
                                                sysConfig.QuadTreeCapacity,
                                                sysConfig.QuadTreeMaxDepth);
}

void PhysicsStepSystem::setPhysicsConfig(const PhysicsConfig& config) {
    validatePhysicsConfig(config);
    setSpecificConfig(config);
}

double PhysicsStepSystem::clampFrameSeconds(double dt) const {
    if (!std::isfinite(dt) || dt < 0.0) {
        return 0.0;
    }
    return std::min(dt, sysConfig.MaxFrameSeconds);
}

const Spatial::QuadTree& PhysicsStepSystem::getSpatialIndex() const {
    return *index;
}

void PhysicsStepSystem::rebuildIndex(entt::registry& registry) {
    PROFILE_SCOPE("RebuildQuadTree");

    index->clear();
    droppedInserts = 0;

    auto view = registry.view<Components::Position, Components::Category>();
    for (auto [entity, pos, category] : view.each()) {
        if (!index->insert(entity, pos)) {
            // Off-screen or non-finite; the particle sits out collisions this frame
            ++droppedInserts;
            DebugStats::recordDroppedInsert();
        }
    }
}

void PhysicsStepSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("PhysicsStepSystem");

    double dt = 0.0;
    bool audioResponsive = true;
    auto stateView = registry.view<Components::SimulatorState>();
    if (!stateView.empty()) {
        const auto& state = stateView.get<Components::SimulatorState>(stateView.front());
        dt = state.frameSeconds;
        audioResponsive = state.audioResponsive;
    }
    dt = clampFrameSeconds(dt);

    Components::AudioState audio;
    auto audioView = registry.view<Components::AudioState>();
    if (!audioView.empty()) {
        audio = audioView.get<Components::AudioState>(audioView.front());
    }

    rebuildIndex(registry);

    double const steps = dt * sysConfig.ReferenceStepsPerSecond;
    const PhysicsConfig& cfg = specificConfig;
    collisionPairs = 0;

    auto particles = registry.view<Components::Position, Components::Velocity,
                                   Components::Mass, Components::Radius,
                                   Components::Category, Components::FloorLevel,
                                   Components::BounceEnergy>();

    PROFILE_SCOPE("IntegrateParticles");
    for (auto [entity, pos, vel, mass, radius, category, floor, bounce] : particles.each()) {
        if (audioResponsive) {
            double const target = AudioBounce::targetEnergy(category.band, audio, cfg.Bounce);
            bounce.value = AudioBounce::smooth(bounce.value, target, category.band, cfg.Bounce);
            AudioBounce::applyFloorImpulse(pos, vel, radius.value, floor.y, mass.value,
                                           bounce.value, cfg.Bounce);
        }

        vel.y += cfg.Gravity * mass.value * steps;

        vel *= cfg.Drag;

        pos += vel * steps;

        collisionPairs += CollisionResolver::resolveNeighbors(registry, entity, *index, cfg, neighbors);

        BoundaryResolver::resolve(pos, vel, radius.value, floor.y, sysConfig.WorldWidth, cfg);
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Physics] dt=" << dt
              << " dropped=" << droppedInserts
              << " pairs=" << collisionPairs << "\n");
}

} // namespace Systems
