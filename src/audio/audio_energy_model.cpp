/**
 * @file audio_energy_model.cpp
 * @brief Sample-window and synthetic band energy estimation
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

#include "beatfield/audio/audio_energy_model.hpp"
#include "beatfield/core/debug.hpp"

namespace Audio {

namespace {

double clampUnit(double v) {
    if (!std::isfinite(v)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, v));
}

// 0 below edge0, 1 above edge1, cubic blend in between
double smoothstep(double edge0, double edge1, double x) {
    double const t = clampUnit((x - edge0) / (edge1 - edge0));
    return t * t * (3.0 - 2.0 * t);
}

double unitSine(double phase) {
    return (std::sin(phase) + 1.0) / 2.0;
}

} // namespace

void validateAudioEnergyConfig(const AudioEnergyConfig& config) {
    if (config.SamplePoints < 3) {
        throw std::invalid_argument("AudioEnergyConfig: SamplePoints must be at least 3");
    }
    if (!std::isfinite(config.BeatThreshold) ||
        config.BeatThreshold < 0.0 || config.BeatThreshold > 1.0) {
        throw std::invalid_argument("AudioEnergyConfig: BeatThreshold must lie in [0, 1]");
    }
    if (!std::isfinite(config.BeatCooldown) || config.BeatCooldown < 0.0) {
        throw std::invalid_argument("AudioEnergyConfig: BeatCooldown must not be negative");
    }
}

AudioEnergyModel::AudioEnergyModel(const AudioEnergyConfig& config)
    : config(config)
{
    validateAudioEnergyConfig(config);
    waveform.assign(config.SamplePoints, 0.0);
}

void AudioEnergyModel::reset() {
    energies = BandEnergies{};
    beatDetected = false;
    beatTimer = 0.0;
    elapsed = 0.0;
    synthetic = true;
    waveform.assign(config.SamplePoints, 0.0);
}

BandEnergies AudioEnergyModel::syntheticEnergies(double t) {
    BandEnergies e;

    e.bass = unitSine(t * 2.0) * 0.7 + unitSine(t * 4.5) * 0.3;
    // Occasional stronger bass peaks, faded in and out so the signal stays continuous
    double const boost = smoothstep(0.5, 0.9, std::sin(t * 0.8));
    e.bass = std::min(1.0, e.bass * (1.0 + 0.3 * boost));

    e.mid = unitSine(t * 3.0 + 1.0) * 0.75 + unitSine(t * 7.3 + 0.4) * 0.25;
    e.treble = unitSine(t * 5.0 + 2.0) * 0.7 + unitSine(t * 11.0 + 2.7) * 0.3;

    e.bass = clampUnit(e.bass);
    e.mid = clampUnit(e.mid);
    e.treble = clampUnit(e.treble);
    return e;
}

void AudioEnergyModel::update(double dt, const IAmplitudeSource* source) {
    if (!std::isfinite(dt) || dt < 0.0) {
        dt = 0.0;
    }
    beatTimer += dt;
    elapsed += dt;

    if (source && source->isAvailable()) {
        synthetic = false;
        updateFromSamples(source->recentSamples(config.SamplePoints));
    } else {
        synthetic = true;
        updateSynthetic();
    }

    detectBeat();
}

void AudioEnergyModel::updateFromSamples(const std::vector<float>& samples) {
    std::size_t const n = std::min(samples.size(), config.SamplePoints);
    if (n == 0) {
        // Nothing played yet; hold the previous energies
        return;
    }

    // Short windows are the tail end of a full one, so align them to the right
    std::size_t const offset = config.SamplePoints - n;
    std::fill(waveform.begin(), waveform.begin() + static_cast<std::ptrdiff_t>(offset), 0.0);
    double const third = static_cast<double>(config.SamplePoints) / 3.0;

    double sums[3] = {0.0, 0.0, 0.0};
    std::size_t counts[3] = {0, 0, 0};

    for (std::size_t i = 0; i < n; ++i) {
        double const raw = samples[samples.size() - n + i];
        double const amplitude = clampUnit(std::fabs(raw));
        std::size_t const slot = offset + i;
        waveform[slot] = amplitude;

        int band = 2;
        if (static_cast<double>(slot) < third) {
            band = 0;
        } else if (static_cast<double>(slot) < 2.0 * third) {
            band = 1;
        }
        sums[band] += amplitude;
        counts[band]++;
    }

    energies.bass = counts[0] ? clampUnit(sums[0] / counts[0]) : 0.0;
    energies.mid = counts[1] ? clampUnit(sums[1] / counts[1]) : 0.0;
    energies.treble = counts[2] ? clampUnit(sums[2] / counts[2]) : 0.0;
}

void AudioEnergyModel::updateSynthetic() {
    double const t = elapsed;
    energies = syntheticEnergies(t);

    for (std::size_t i = 0; i < waveform.size(); ++i) {
        double const k = static_cast<double>(i + 1);
        waveform[i] = std::fabs(std::sin(t * 4.0 + k / 20.0) * std::cos(t + k / 10.0)) * 0.5;
    }
}

void AudioEnergyModel::detectBeat() {
    if (energies.bass > config.BeatThreshold && beatTimer > config.BeatCooldown) {
        beatDetected = true;
        beatTimer = 0.0;
        DebugStats::recordBeat();
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Audio] beat at t=" << elapsed
                  << " bass=" << energies.bass << "\n");
    } else {
        beatDetected = false;
    }
}

} // namespace Audio
