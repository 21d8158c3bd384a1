/**
 * @file audio_energy_model.hpp
 * @brief Band energies and beat detection driving the particle bounces
 */

#pragma once

#include <cstddef>
#include <vector>

#include "beatfield/audio/amplitude_source.hpp"
#include "beatfield/core/constants.hpp"

namespace Audio {

/**
 * @brief Tunables for AudioEnergyModel
 */
struct AudioEnergyConfig {
    std::size_t SamplePoints = SimulatorConstants::WaveformSamplePoints;  // window and waveform length
    double BeatThreshold = 0.5;       // bass energy a beat must exceed
    double BeatCooldown = 0.1;        // seconds between beats, at least
};

/**
 * @throws std::invalid_argument when a field is out of range
 */
void validateAudioEnergyConfig(const AudioEnergyConfig& config);

/**
 * @brief Low, middle and high band energies, each in [0, 1]
 */
struct BandEnergies {
    double bass = 0.0;
    double mid = 0.0;
    double treble = 0.0;
};

/**
 * @class AudioEnergyModel
 * @brief Turns a sample stream (or elapsed time) into three band energies
 *        and a rate-limited beat flag.
 *
 * With an available IAmplitudeSource the window of recent samples is split
 * into thirds and each third's mean absolute amplitude becomes one band.
 * Without one, a deterministic mix of sinusoids of the model's own elapsed
 * time is used instead so the simulation stays lively with no audio asset.
 */
class AudioEnergyModel {
public:
    explicit AudioEnergyModel(const AudioEnergyConfig& config = AudioEnergyConfig());

    /**
     * @brief Advance by dt seconds and recompute energies and the beat flag
     * @param dt Elapsed seconds; negative or non-finite values count as 0
     * @param source Sample provider, or nullptr for the synthetic signal
     */
    void update(double dt, const IAmplitudeSource* source);

    /**
     * @brief Restore the freshly constructed state
     */
    void reset();

    /**
     * @brief Synthetic band energies at time t (seconds)
     *
     * Continuous in t and bounded to [0, 1].
     */
    static BandEnergies syntheticEnergies(double t);

    double getBassEnergy() const { return energies.bass; }
    double getMidEnergy() const { return energies.mid; }
    double getTrebleEnergy() const { return energies.treble; }
    const BandEnergies& getEnergies() const { return energies; }
    bool isBeatDetected() const { return beatDetected; }
    double getBeatTimer() const { return beatTimer; }
    double getElapsedSeconds() const { return elapsed; }
    bool usingSyntheticSignal() const { return synthetic; }

    /// Amplitudes for the waveform display, SamplePoints values in [0, 1]
    const std::vector<double>& getWaveform() const { return waveform; }

    const AudioEnergyConfig& getConfig() const { return config; }

private:
    void updateFromSamples(const std::vector<float>& samples);
    void updateSynthetic();
    void detectBeat();

    AudioEnergyConfig config;
    BandEnergies energies;
    bool beatDetected = false;
    double beatTimer = 0.0;
    double elapsed = 0.0;
    bool synthetic = true;
    std::vector<double> waveform;
};

} // namespace Audio
