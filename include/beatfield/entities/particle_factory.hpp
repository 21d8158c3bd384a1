#pragma once

#include <cstddef>
#include <random>
#include <utility>

#include <entt/entt.hpp>

#include "beatfield/components/basic.hpp"

namespace Entities {

/**
 * Everything needed to create one particle.
 */
struct ParticleSpec {
    Components::Position position;
    Components::Velocity velocity;
    double mass = 1.0;
    double radius = 3.0;
    Components::BandCategory band = Components::BandCategory::Bass;
    double floorY = 0.0;
};

/**
 * World extents used to place new particles and their floor levels.
 */
struct SpawnArea {
    double width = 800.0;
    double height = 600.0;
};

/**
 * Factory for the particle entities and the spawn presets bound to user input.
 * All random choices are drawn from the caller's generator so a seeded
 * simulator produces the same population every run.
 */
class ParticleFactory {
public:
    /**
     * Creates one particle with the full component set and zero bounce energy.
     *
     * @throws std::invalid_argument if mass < 1, radius <= 0 or any
     *         coordinate is not finite
     */
    static entt::entity createParticle(entt::registry& registry, const ParticleSpec& spec);

    /**
     * Initial population: random category, integer position in
     * [1, width] x [1, height], velocity in [-1, 1), mass 1..4.
     */
    static void populate(entt::registry& registry, std::mt19937& rng,
                         std::size_t count, const SpawnArea& area);

    /**
     * Mixed burst of random categories exactly at (x, y).
     */
    static void spawnMixed(entt::registry& registry, std::mt19937& rng,
                           const SpawnArea& area, double x, double y);

    /**
     * Burst of a single category scattered around (x, y).
     */
    static void spawnCategory(entt::registry& registry, std::mt19937& rng,
                              const SpawnArea& area, Components::BandCategory band,
                              double x, double y);

    static std::size_t count(const entt::registry& registry);

    /// Destroys every particle; other entities are left alone
    static void clear(entt::registry& registry);

    static Components::Color baseColor(Components::BandCategory band);

    /// Inclusive integer mass range used by spawnCategory
    static std::pair<int, int> massRange(Components::BandCategory band);

    /// A floor level inside the band at the bottom of the area
    static double randomFloorLevel(std::mt19937& rng, const SpawnArea& area);

    static Components::BandCategory randomCategory(std::mt19937& rng);
};

} // namespace Entities
