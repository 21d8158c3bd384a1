/**
 * @file simulation_config.hpp
 * @brief Everything needed to construct an ECSSimulator
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "beatfield/audio/audio_energy_model.hpp"
#include "beatfield/core/constants.hpp"
#include "beatfield/core/system_config.hpp"
#include "beatfield/systems/physics_config.hpp"

struct SimulationConfig {
    SystemConfig System;
    Systems::PhysicsConfig Physics;
    Audio::AudioEnergyConfig AudioModel;

    std::size_t InitialParticleCount = SimulatorConstants::InitialParticleCount;

    // 0 seeds from std::random_device
    uint32_t Seed = 0;

    // Step applied by the gravity up/down commands
    double GravityStep = 0.02;

    /**
     * @throws std::invalid_argument naming the first out-of-range field
     */
    void validate() const;
};
