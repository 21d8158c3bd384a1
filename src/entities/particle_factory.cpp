#include "beatfield/entities/particle_factory.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "beatfield/core/constants.hpp"

namespace Entities {

entt::entity ParticleFactory::createParticle(entt::registry& registry, const ParticleSpec& spec) {
    if (!(spec.mass >= 1.0) || !std::isfinite(spec.mass)) {
        throw std::invalid_argument("ParticleFactory: mass must be at least 1");
    }
    if (!(spec.radius > 0.0) || !std::isfinite(spec.radius)) {
        throw std::invalid_argument("ParticleFactory: radius must be positive");
    }
    if (!spec.position.isFinite() || !spec.velocity.isFinite() || !std::isfinite(spec.floorY)) {
        throw std::invalid_argument("ParticleFactory: particle coordinates must be finite");
    }

    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, spec.position);
    registry.emplace<Components::Velocity>(entity, spec.velocity);
    registry.emplace<Components::Mass>(entity, spec.mass);
    registry.emplace<Components::Radius>(entity, spec.radius);
    registry.emplace<Components::Category>(entity, spec.band);
    registry.emplace<Components::FloorLevel>(entity, spec.floorY);
    registry.emplace<Components::BounceEnergy>(entity, 0.0);
    registry.emplace<Components::Color>(entity, baseColor(spec.band));
    return entity;
}

void ParticleFactory::populate(entt::registry& registry, std::mt19937& rng,
                               std::size_t count, const SpawnArea& area)
{
    int const maxX = std::max(1, static_cast<int>(area.width));
    int const maxY = std::max(1, static_cast<int>(area.height));
    std::uniform_int_distribution<int> xDist(1, maxX);
    std::uniform_int_distribution<int> yDist(1, maxY);
    std::uniform_real_distribution<double> velDist(-1.0, 1.0);
    std::uniform_int_distribution<int> massDist(1, 4);

    for (std::size_t i = 0; i < count; ++i) {
        ParticleSpec spec;
        spec.band = randomCategory(rng);
        spec.position = Components::Position(xDist(rng), yDist(rng));
        spec.velocity = Components::Velocity(velDist(rng), velDist(rng));
        spec.mass = massDist(rng);
        spec.radius = SimulatorConstants::ParticleRadius;
        spec.floorY = randomFloorLevel(rng, area);
        createParticle(registry, spec);
    }
}

void ParticleFactory::spawnMixed(entt::registry& registry, std::mt19937& rng,
                                 const SpawnArea& area, double x, double y)
{
    std::uniform_real_distribution<double> velDist(-2.5, 2.5);
    std::uniform_int_distribution<int> massDist(1, 4);

    for (std::size_t i = 0; i < SimulatorConstants::MixedBurstSize; ++i) {
        ParticleSpec spec;
        spec.band = randomCategory(rng);
        spec.position = Components::Position(x, y);
        spec.velocity = Components::Velocity(velDist(rng), velDist(rng));
        spec.mass = massDist(rng);
        spec.radius = SimulatorConstants::ParticleRadius;
        spec.floorY = randomFloorLevel(rng, area);
        createParticle(registry, spec);
    }
}

void ParticleFactory::spawnCategory(entt::registry& registry, std::mt19937& rng,
                                    const SpawnArea& area, Components::BandCategory band,
                                    double x, double y)
{
    double const jitter = SimulatorConstants::CategoryBurstJitter;
    std::uniform_real_distribution<double> offsetDist(-jitter, jitter);
    std::uniform_real_distribution<double> velDist(-2.5, 2.5);
    auto const range = massRange(band);
    std::uniform_int_distribution<int> massDist(range.first, range.second);

    for (std::size_t i = 0; i < SimulatorConstants::CategoryBurstSize; ++i) {
        ParticleSpec spec;
        spec.band = band;
        spec.position = Components::Position(x + offsetDist(rng), y + offsetDist(rng));
        spec.velocity = Components::Velocity(velDist(rng), velDist(rng));
        spec.mass = massDist(rng);
        spec.radius = SimulatorConstants::ParticleRadius;
        spec.floorY = randomFloorLevel(rng, area);
        createParticle(registry, spec);
    }
}

std::size_t ParticleFactory::count(const entt::registry& registry) {
    return registry.view<const Components::Category>().size();
}

void ParticleFactory::clear(entt::registry& registry) {
    auto view = registry.view<Components::Category>();
    std::vector<entt::entity> doomed(view.begin(), view.end());
    registry.destroy(doomed.begin(), doomed.end());
}

Components::Color ParticleFactory::baseColor(Components::BandCategory band) {
    switch (band) {
        case Components::BandCategory::Bass:
            return Components::Color(204, 51, 51);
        case Components::BandCategory::Mid:
            return Components::Color(51, 204, 51);
        case Components::BandCategory::Treble:
            return Components::Color(51, 51, 204);
    }
    return Components::Color();
}

std::pair<int, int> ParticleFactory::massRange(Components::BandCategory band) {
    switch (band) {
        case Components::BandCategory::Bass:   return {2, 4};
        case Components::BandCategory::Mid:    return {1, 3};
        case Components::BandCategory::Treble: return {1, 2};
    }
    return {1, 4};
}

double ParticleFactory::randomFloorLevel(std::mt19937& rng, const SpawnArea& area) {
    int const band = static_cast<int>(SimulatorConstants::FloorBandHeight);
    std::uniform_int_distribution<int> dist(1, band);
    return area.height - SimulatorConstants::FloorBandHeight + dist(rng);
}

Components::BandCategory ParticleFactory::randomCategory(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, 2);
    return static_cast<Components::BandCategory>(dist(rng));
}

} // namespace Entities
