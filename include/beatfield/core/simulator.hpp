/**
 * @file simulator.hpp
 * @brief Owns the particle registry and drives one frame of simulation
 */

#pragma once

#include <cstddef>
#include <memory>
#include <random>

#include <entt/entt.hpp>

#include "beatfield/audio/amplitude_source.hpp"
#include "beatfield/audio/audio_energy_model.hpp"
#include "beatfield/components/sim.hpp"
#include "beatfield/core/commands.hpp"
#include "beatfield/core/simulation_config.hpp"
#include "beatfield/entities/particle_factory.hpp"
#include "beatfield/spatial/quad_tree.hpp"
#include "beatfield/systems/physics_step.hpp"

/**
 * @class ECSSimulator
 * @brief Registry, audio model and physics step for one particle world.
 *
 * A frame is audio first, then physics. The simulator does no drawing; the
 * renderer reads the registry, the audio model and the spatial index.
 */
class ECSSimulator {
public:
    /**
     * @throws std::invalid_argument if the configuration is out of range
     */
    explicit ECSSimulator(const SimulationConfig& config = SimulationConfig());
    ~ECSSimulator();

    /**
     * @brief Creates the state entity and the initial population
     */
    void init();

    /**
     * @brief Destroys every particle and repopulates; audio state and the
     *        responsive flag carry over
     */
    void reset();

    /**
     * @brief Advances the world by dt seconds (clamped to MaxFrameSeconds)
     */
    void tick(double dt);

    /**
     * @brief Executes a user command
     */
    void apply(const Command& command);

    /**
     * @brief Installs a real sample source; nullptr selects the synthetic signal
     */
    void setAmplitudeSource(std::unique_ptr<Audio::IAmplitudeSource> source);
    const Audio::IAmplitudeSource* getAmplitudeSource() const { return amplitudeSource.get(); }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    const Spatial::QuadTree& getSpatialIndex() const { return physics.getSpatialIndex(); }
    const Audio::AudioEnergyModel& getAudioModel() const { return audioModel; }
    const SimulationConfig& getConfig() const { return config; }

    const Components::SimulatorState& getState() const;
    const Components::AudioState& getAudioState() const;

    bool isAudioResponsive() const;
    double getGravity() const { return config.Physics.Gravity; }
    std::size_t particleCount() const;
    std::size_t droppedLastFrame() const { return physics.droppedLastFrame(); }

private:
    void ensureStateEntity();
    void spawn(const Command& command);
    void setGravity(double gravity);

    SimulationConfig config;
    entt::registry registry;
    entt::entity stateEntity = entt::null;

    Audio::AudioEnergyModel audioModel;
    Systems::PhysicsStepSystem physics;
    std::unique_ptr<Audio::IAmplitudeSource> amplitudeSource;
    std::mt19937 rng;
};
