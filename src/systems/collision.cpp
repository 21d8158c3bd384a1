#include "beatfield/systems/collision.hpp"

#include <algorithm>

#include "beatfield/core/debug.hpp"

namespace Systems {

bool CollisionResolver::resolvePair(CollisionBody& a, CollisionBody& b, const PhysicsConfig& config) {
    Vector const delta = b.position - a.position;
    double const distance = delta.length();
    double const minDist = a.radius + b.radius;

    if (!(distance < minDist)) {
        return false;
    }

    double const overlap = minDist - distance;

    if (distance < EPSILON) {
        Vector const push(overlap * 0.5, 0.0);
        a.position -= push;
        b.position += push;
        DebugStats::recordCoincidentPair();
        return true;
    }

    Vector const normal = delta / distance;
    Vector const correction = normal * (overlap * 0.5);
    a.position -= correction;
    b.position += correction;

    double const repulsion = config.RepulsionStrength / (distance + 1.0);
    Vector const impulse = normal * repulsion;
    a.velocity -= impulse / std::max(1.0, a.mass);
    b.velocity += impulse / std::max(1.0, b.mass);

    DebugStats::recordCollisionPair();
    return true;
}

std::size_t CollisionResolver::resolveNeighbors(entt::registry& registry,
                                                entt::entity entity,
                                                const Spatial::QuadTree& index,
                                                const PhysicsConfig& config,
                                                std::vector<entt::entity>& scratch)
{
    auto& pos = registry.get<Components::Position>(entity);
    auto& vel = registry.get<Components::Velocity>(entity);
    double const mass = registry.get<Components::Mass>(entity).value;
    double const radius = registry.get<Components::Radius>(entity).value;

    double const window = radius * config.NeighborWindowScale;
    scratch.clear();
    index.query(Spatial::Region(pos.x, pos.y, window, window), registry, scratch);

    CollisionBody self{pos, vel, mass, radius};
    std::size_t resolved = 0;

    for (auto neighbor : scratch) {
        if (neighbor == entity) {
            continue;
        }
        auto [otherPos, otherVel, otherMass, otherRadius] =
            registry.get<Components::Position, Components::Velocity,
                         Components::Mass, Components::Radius>(neighbor);

        CollisionBody other{otherPos, otherVel, otherMass.value, otherRadius.value};
        if (resolvePair(self, other, config)) {
            ++resolved;
        }
    }
    return resolved;
}

} // namespace Systems
