#include "beatfield/core/simulation_config.hpp"

#include <cmath>
#include <stdexcept>

void SimulationConfig::validate() const {
    validateSystemConfig(System);
    Systems::validatePhysicsConfig(Physics);
    Audio::validateAudioEnergyConfig(AudioModel);

    if (!std::isfinite(GravityStep) || GravityStep < 0.0) {
        throw std::invalid_argument("SimulationConfig: GravityStep must not be negative");
    }
    if (System.WorldWidth < 1.0 || System.WorldHeight < 1.0) {
        throw std::invalid_argument("SimulationConfig: world must be at least one unit on each side");
    }
}
