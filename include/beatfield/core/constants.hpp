#ifndef BEATFIELD_SIMULATOR_CONSTANTS_HPP
#define BEATFIELD_SIMULATOR_CONSTANTS_HPP

#include <cstddef>

namespace SimulatorConstants {

    // Display
    extern const unsigned int TargetFramesPerSecond;
    extern const double ProfilerPrintIntervalSeconds;

    // Particle population
    extern const double FloorBandHeight;
    extern const double ParticleRadius;
    extern const std::size_t InitialParticleCount;
    extern const std::size_t MixedBurstSize;
    extern const std::size_t CategoryBurstSize;
    extern const double CategoryBurstJitter;

    // Audio
    extern const std::size_t WaveformSamplePoints;
}

#endif // BEATFIELD_SIMULATOR_CONSTANTS_HPP
