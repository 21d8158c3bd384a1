#pragma once

#include <cstdint>

namespace Components {

    /**
     * @brief Frame-level state shared by the systems; lives on a single entity.
     */
    struct SimulatorState {
        double frameSeconds = 0.0;      // dt for this frame, already clamped
        bool audioResponsive = true;
        uint64_t frameIndex = 0;

        SimulatorState(double dt = 0.0, bool responsive = true)
            : frameSeconds(dt)
            , audioResponsive(responsive) {}
    };

    /**
     * @brief Band energies and beat flag published by the audio model for
     *        the current frame.
     */
    struct AudioState {
        double bass = 0.0;
        double mid = 0.0;
        double treble = 0.0;
        bool beatDetected = false;
    };
}
