/**
 * @file amplitude_source.hpp
 * @brief Interface for anything that can hand the audio model raw samples
 */

#pragma once

#include <cstddef>
#include <vector>

namespace Audio {

/**
 * @class IAmplitudeSource
 * @brief Supplies the most recent playback samples to the energy model.
 *
 * The simulator falls back to the synthetic signal whenever no source is set
 * or the source reports it is unavailable.
 */
class IAmplitudeSource {
public:
    virtual ~IAmplitudeSource() = default;

    /**
     * @brief True while the source is able to supply samples
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Up to `count` samples ending at the playback position
     *
     * Samples are ordered oldest first and normalised to [-1, 1]. Near the
     * start of playback fewer than `count` samples may be returned.
     */
    virtual std::vector<float> recentSamples(std::size_t count) const = 0;
};

} // namespace Audio
