#include "beatfield/systems/physics_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace Systems {

namespace {

void requireNonNegative(double value, const char* field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(std::string("PhysicsConfig: ") + field +
                                    " must be finite and non-negative");
    }
}

void requireFraction(double value, const char* field) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw std::invalid_argument(std::string("PhysicsConfig: ") + field +
                                    " must lie in [0, 1]");
    }
}

} // namespace

void validatePhysicsConfig(const PhysicsConfig& config) {
    requireNonNegative(config.Gravity, "Gravity");
    if (!std::isfinite(config.Drag) || config.Drag <= 0.0 || config.Drag > 1.0) {
        throw std::invalid_argument("PhysicsConfig: Drag must lie in (0, 1]");
    }
    requireNonNegative(config.RepulsionStrength, "RepulsionStrength");
    if (!std::isfinite(config.NeighborWindowScale) || config.NeighborWindowScale <= 0.0) {
        throw std::invalid_argument("PhysicsConfig: NeighborWindowScale must be positive");
    }
    requireNonNegative(config.WallDamping, "WallDamping");
    requireNonNegative(config.FloorDamping, "FloorDamping");
    requireNonNegative(config.CeilingDamping, "CeilingDamping");

    const AudioBounceConfig& b = config.Bounce;
    requireNonNegative(b.BassWeight, "Bounce.BassWeight");
    requireNonNegative(b.BassMidCrossWeight, "Bounce.BassMidCrossWeight");
    requireNonNegative(b.MidWeight, "Bounce.MidWeight");
    requireNonNegative(b.TrebleWeight, "Bounce.TrebleWeight");
    requireNonNegative(b.BassBeatBonus, "Bounce.BassBeatBonus");
    requireNonNegative(b.MidBeatBonus, "Bounce.MidBeatBonus");
    requireNonNegative(b.TrebleBeatBonus, "Bounce.TrebleBeatBonus");
    requireFraction(b.BassSmoothing, "Bounce.BassSmoothing");
    requireFraction(b.OtherSmoothing, "Bounce.OtherSmoothing");
    requireNonNegative(b.ImpulseThreshold, "Bounce.ImpulseThreshold");
    requireNonNegative(b.ImpulseScale, "Bounce.ImpulseScale");
}

} // namespace Systems
