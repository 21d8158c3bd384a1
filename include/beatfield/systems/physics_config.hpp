/**
 * @file physics_config.hpp
 * @brief Tunables for the per-particle physics step
 */

#pragma once

namespace Systems {

/**
 * @brief Weights turning band energies into a particle's bounce target.
 *
 * These are empirical tuning values; bass particles also pick up a little
 * of the mid band so they stay lively between bass hits.
 */
struct AudioBounceConfig {
    double BassWeight = 25.0;
    double BassMidCrossWeight = 5.0;
    double MidWeight = 10.0;
    double TrebleWeight = 7.0;

    // Added to the target on the frame a beat fires
    double BassBeatBonus = 20.0;
    double MidBeatBonus = 7.0;
    double TrebleBeatBonus = 5.0;

    // Fraction of the target blended in per frame
    double BassSmoothing = 0.2;
    double OtherSmoothing = 0.05;

    double ImpulseThreshold = 0.5;   // energy needed to leave the floor
    double ImpulseScale = 0.5;       // upward speed per unit energy per unit mass
};

/**
 * @brief Forces, drag, collision and boundary constants.
 */
struct PhysicsConfig {
    double Gravity = 0.1;
    double Drag = 0.98;                  // per-frame velocity multiplier
    double RepulsionStrength = 5.0;
    double NeighborWindowScale = 4.0;    // query window side, in radii
    double WallDamping = 0.8;
    double FloorDamping = 0.5;
    double CeilingDamping = 0.8;

    AudioBounceConfig Bounce;
};

/**
 * @throws std::invalid_argument naming the offending field
 */
void validatePhysicsConfig(const PhysicsConfig& config);

} // namespace Systems
