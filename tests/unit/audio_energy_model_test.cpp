#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>
#include "beatfield/audio/audio_energy_model.hpp"

using namespace Audio;

namespace {

class FakeSource : public IAmplitudeSource {
public:
    bool available = true;
    std::vector<float> samples;

    bool isAvailable() const override { return available; }

    std::vector<float> recentSamples(std::size_t count) const override {
        if (samples.size() <= count) {
            return samples;
        }
        return std::vector<float>(samples.end() - static_cast<std::ptrdiff_t>(count), samples.end());
    }
};

void expectUnit(const AudioEnergyModel& model) {
    EXPECT_GE(model.getBassEnergy(), 0.0);
    EXPECT_LE(model.getBassEnergy(), 1.0);
    EXPECT_GE(model.getMidEnergy(), 0.0);
    EXPECT_LE(model.getMidEnergy(), 1.0);
    EXPECT_GE(model.getTrebleEnergy(), 0.0);
    EXPECT_LE(model.getTrebleEnergy(), 1.0);
}

} // namespace

class AudioEnergyModelTest : public ::testing::Test {
protected:
    AudioEnergyModel model;
    FakeSource source;
};

TEST_F(AudioEnergyModelTest, RejectsInvalidConfig) {
    AudioEnergyConfig cfg;
    cfg.SamplePoints = 2;
    EXPECT_THROW(AudioEnergyModel{cfg}, std::invalid_argument);

    cfg = AudioEnergyConfig();
    cfg.BeatCooldown = -0.1;
    EXPECT_THROW(AudioEnergyModel{cfg}, std::invalid_argument);

    cfg = AudioEnergyConfig();
    cfg.BeatThreshold = 1.5;
    EXPECT_THROW(AudioEnergyModel{cfg}, std::invalid_argument);
}

TEST_F(AudioEnergyModelTest, StartsQuiet) {
    EXPECT_DOUBLE_EQ(model.getBassEnergy(), 0.0);
    EXPECT_FALSE(model.isBeatDetected());
    EXPECT_EQ(model.getWaveform().size(), 256u);
}

TEST_F(AudioEnergyModelTest, ThirdsAreAveragedIntoBands) {
    source.samples.assign(256, 0.0F);
    for (std::size_t i = 0; i < 256; ++i) {
        if (i < 86) {
            source.samples[i] = (i % 2 == 0) ? 0.9F : -0.9F;
        } else if (i < 171) {
            source.samples[i] = 0.3F;
        } else {
            source.samples[i] = -0.6F;
        }
    }

    model.update(1.0 / 60.0, &source);

    EXPECT_FALSE(model.usingSyntheticSignal());
    EXPECT_NEAR(model.getBassEnergy(), 0.9, 1e-6);
    EXPECT_NEAR(model.getMidEnergy(), 0.3, 1e-6);
    EXPECT_NEAR(model.getTrebleEnergy(), 0.6, 1e-6);
    EXPECT_NEAR(model.getWaveform()[0], 0.9, 1e-6);
}

TEST_F(AudioEnergyModelTest, ShortWindowIsRightAligned) {
    source.samples.assign(100, 1.0F);
    model.update(1.0 / 60.0, &source);

    // Only the last 100 of 256 slots are filled, none of them in the bass third
    EXPECT_DOUBLE_EQ(model.getBassEnergy(), 0.0);
    EXPECT_DOUBLE_EQ(model.getMidEnergy(), 1.0);
    EXPECT_DOUBLE_EQ(model.getTrebleEnergy(), 1.0);
}

TEST_F(AudioEnergyModelTest, ShortWindowClearsStaleWaveform) {
    source.samples.assign(256, 0.8F);
    model.update(1.0 / 60.0, &source);
    ASSERT_NEAR(model.getWaveform()[0], 0.8, 1e-6);

    source.samples.assign(56, 0.5F);
    model.update(1.0 / 60.0, &source);

    const auto& wave = model.getWaveform();
    for (std::size_t i = 0; i < 200; ++i) {
        EXPECT_DOUBLE_EQ(wave[i], 0.0) << "slot " << i;
    }
    for (std::size_t i = 200; i < 256; ++i) {
        EXPECT_NEAR(wave[i], 0.5, 1e-6) << "slot " << i;
    }
}

TEST_F(AudioEnergyModelTest, EmptyWindowKeepsPreviousEnergies) {
    source.samples.assign(256, 0.4F);
    model.update(0.016, &source);
    double const bass = model.getBassEnergy();

    source.samples.clear();
    model.update(0.016, &source);
    EXPECT_DOUBLE_EQ(model.getBassEnergy(), bass);
    EXPECT_FALSE(model.usingSyntheticSignal());
}

TEST_F(AudioEnergyModelTest, UnavailableSourceFallsBackToSynthetic) {
    source.available = false;
    source.samples.assign(256, 1.0F);
    model.update(0.5, &source);
    EXPECT_TRUE(model.usingSyntheticSignal());

    AudioEnergyModel other;
    other.update(0.5, nullptr);
    EXPECT_DOUBLE_EQ(model.getBassEnergy(), other.getBassEnergy());
    EXPECT_DOUBLE_EQ(model.getTrebleEnergy(), other.getTrebleEnergy());
}

TEST_F(AudioEnergyModelTest, EnergiesStayInUnitRangeForHostileInput) {
    std::mt19937 rng(4);
    std::uniform_real_distribution<float> wild(-50.0F, 50.0F);
    std::uniform_real_distribution<double> dts(0.0, 0.2);
    float const nan = std::numeric_limits<float>::quiet_NaN();
    float const inf = std::numeric_limits<float>::infinity();

    for (int frame = 0; frame < 500; ++frame) {
        source.samples.clear();
        std::size_t const n = static_cast<std::size_t>(frame % 300);
        for (std::size_t i = 0; i < n; ++i) {
            source.samples.push_back(wild(rng));
        }
        if (n > 3) {
            source.samples[0] = nan;
            source.samples[1] = inf;
            source.samples[2] = -inf;
        }
        source.available = (frame % 7) != 0;

        model.update(dts(rng), &source);
        expectUnit(model);
        for (double w : model.getWaveform()) {
            EXPECT_GE(w, 0.0);
            EXPECT_LE(w, 1.0);
        }
    }
}

TEST_F(AudioEnergyModelTest, SyntheticSignalIsBoundedContinuousAndVaried) {
    double minBass = 1.0;
    double maxBass = 0.0;
    BandEnergies prev = AudioEnergyModel::syntheticEnergies(0.0);

    double const step = 1e-4;
    for (int i = 1; i < 200000; ++i) {
        BandEnergies e = AudioEnergyModel::syntheticEnergies(i * step);
        ASSERT_GE(e.bass, 0.0);
        ASSERT_LE(e.bass, 1.0);
        ASSERT_GE(e.mid, 0.0);
        ASSERT_LE(e.mid, 1.0);
        ASSERT_GE(e.treble, 0.0);
        ASSERT_LE(e.treble, 1.0);

        // Largest derivative is well under 20 per second
        ASSERT_LT(std::fabs(e.bass - prev.bass), 20.0 * step);
        ASSERT_LT(std::fabs(e.mid - prev.mid), 20.0 * step);
        ASSERT_LT(std::fabs(e.treble - prev.treble), 20.0 * step);

        minBass = std::min(minBass, e.bass);
        maxBass = std::max(maxBass, e.bass);
        prev = e;
    }
    EXPECT_GT(maxBass - minBass, 0.5);
}

TEST_F(AudioEnergyModelTest, SyntheticPathIsDeterministic) {
    AudioEnergyModel a;
    AudioEnergyModel b;
    for (int i = 0; i < 100; ++i) {
        a.update(0.016, nullptr);
        b.update(0.016, nullptr);
        ASSERT_DOUBLE_EQ(a.getBassEnergy(), b.getBassEnergy());
        ASSERT_EQ(a.isBeatDetected(), b.isBeatDetected());
    }
    EXPECT_EQ(a.getWaveform(), b.getWaveform());
}

TEST_F(AudioEnergyModelTest, BeatsNeverCloserThanCooldown) {
    std::mt19937 rng(8);
    std::uniform_real_distribution<double> dts(0.0, 0.07);
    std::uniform_real_distribution<float> amp(0.0F, 1.0F);

    double t = 0.0;
    double lastBeat = -1.0;
    int beats = 0;
    for (int frame = 0; frame < 5000; ++frame) {
        double const dt = (frame % 13 == 0) ? 0.0 : dts(rng);
        t += dt;

        const IAmplitudeSource* src = nullptr;
        if ((frame / 500) % 2 == 1) {
            source.samples.assign(256, amp(rng));
            src = &source;
        }
        model.update(dt, src);

        if (model.isBeatDetected()) {
            if (lastBeat >= 0.0) {
                EXPECT_GT(t - lastBeat, model.getConfig().BeatCooldown - 1e-12);
            }
            lastBeat = t;
            ++beats;
        }
    }
    EXPECT_GT(beats, 0);
}

TEST_F(AudioEnergyModelTest, BeatNeedsBassAboveThreshold) {
    source.samples.assign(256, 0.2F);
    for (int i = 0; i < 100; ++i) {
        model.update(0.05, &source);
        EXPECT_FALSE(model.isBeatDetected());
    }

    source.samples.assign(256, 0.9F);
    model.update(0.05, &source);
    EXPECT_TRUE(model.isBeatDetected());
    EXPECT_DOUBLE_EQ(model.getBeatTimer(), 0.0);

    // Still loud, but inside the cooldown
    model.update(0.05, &source);
    EXPECT_FALSE(model.isBeatDetected());
}

TEST_F(AudioEnergyModelTest, InvalidTimeStepCountsAsZero) {
    model.update(0.25, nullptr);
    double const elapsed = model.getElapsedSeconds();

    model.update(-1.0, nullptr);
    model.update(std::numeric_limits<double>::quiet_NaN(), nullptr);
    EXPECT_DOUBLE_EQ(model.getElapsedSeconds(), elapsed);
    expectUnit(model);
}

TEST_F(AudioEnergyModelTest, ResetRestoresInitialState) {
    for (int i = 0; i < 50; ++i) {
        model.update(0.05, nullptr);
    }
    model.reset();
    EXPECT_DOUBLE_EQ(model.getElapsedSeconds(), 0.0);
    EXPECT_DOUBLE_EQ(model.getBassEnergy(), 0.0);
    EXPECT_FALSE(model.isBeatDetected());
    for (double w : model.getWaveform()) {
        EXPECT_DOUBLE_EQ(w, 0.0);
    }
}
