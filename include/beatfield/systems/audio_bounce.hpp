/**
 * @file audio_bounce.hpp
 * @brief Audio-driven floor bounces (stages a-c of the physics step)
 *
 * Each particle keeps a smoothed bounce energy that chases a target derived
 * from its own band. When the energy is high enough and the particle is
 * resting on its floor, it is launched upwards.
 */

#pragma once

#include "beatfield/components/basic.hpp"
#include "beatfield/components/sim.hpp"
#include "beatfield/systems/physics_config.hpp"

namespace Systems {

class AudioBounce {
public:
    /**
     * @brief Energy the particle's accumulator is pulled towards this frame
     */
    static double targetEnergy(Components::BandCategory band,
                               const Components::AudioState& audio,
                               const AudioBounceConfig& config);

    /**
     * @brief One exponential smoothing step; bass reacts faster
     */
    static double smooth(double current, double target,
                         Components::BandCategory band,
                         const AudioBounceConfig& config);

    /**
     * @brief Launches a particle resting on its floor
     * @return true if the vertical velocity was replaced by an impulse
     */
    static bool applyFloorImpulse(const Components::Position& pos,
                                  Components::Velocity& vel,
                                  double radius, double floorY, double mass,
                                  double energy,
                                  const AudioBounceConfig& config);
};

} // namespace Systems
