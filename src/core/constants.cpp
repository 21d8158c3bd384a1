#include "beatfield/core/constants.hpp"

namespace SimulatorConstants {

    // Display
    const unsigned int TargetFramesPerSecond  = 60;
    const double ProfilerPrintIntervalSeconds = 10.0;

    // Particles rest on a band at the bottom of the screen
    const double FloorBandHeight              = 50.0;
    const double ParticleRadius               = 3.0;
    const std::size_t InitialParticleCount    = 500;
    const std::size_t MixedBurstSize          = 50;
    const std::size_t CategoryBurstSize       = 20;
    const double CategoryBurstJitter          = 20.0;

    const std::size_t WaveformSamplePoints    = 256;

} // namespace SimulatorConstants
