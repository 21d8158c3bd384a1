#ifndef BEATFIELD_COMPONENTS_BASIC_HPP
#define BEATFIELD_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "beatfield/math/vector_math.hpp"

namespace Components {

    /**
     * @brief Audio band a particle responds to.
     */
    enum class BandCategory {
        Bass,
        Mid,
        Treble
    };

    using Position = ::Position;
    using Velocity = ::Vector;

    struct Mass {
        double value;
    };

    struct Radius {
        double value;
    };

    struct Category {
        BandCategory band;
    };

    // Per-particle resting height; the particle's bottom edge rests here
    struct FloorLevel {
        double y;
    };

    // Smoothed audio-driven energy that launches the particle off its floor
    struct BounceEnergy {
        double value = 0.0;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif
