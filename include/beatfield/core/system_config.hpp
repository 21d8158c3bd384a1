#pragma once

/**
 * @struct SystemConfig
 * @brief World parameters shared by every ECS system.
 */
struct SystemConfig {
    double WorldWidth = 800.0;
    double WorldHeight = 600.0;

    // Longest frame the integrator will simulate after a stall
    double MaxFrameSeconds = 0.05;
    // Velocities are expressed per reference frame at this rate
    double ReferenceStepsPerSecond = 60.0;

    int QuadTreeCapacity = 8;
    int QuadTreeMaxDepth = 16;
};

/**
 * @brief Rejects out-of-range shared parameters.
 * @throws std::invalid_argument naming the offending field
 */
void validateSystemConfig(const SystemConfig& config);
