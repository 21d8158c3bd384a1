#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>
#include "beatfield/components/basic.hpp"
#include "beatfield/core/simulator.hpp"

namespace {

class ConstantSource : public Audio::IAmplitudeSource {
public:
    explicit ConstantSource(float level) : level(level) {}
    bool isAvailable() const override { return true; }
    std::vector<float> recentSamples(std::size_t count) const override {
        return std::vector<float>(count, level);
    }

private:
    float level;
};

SimulationConfig smallConfig() {
    SimulationConfig cfg;
    cfg.InitialParticleCount = 120;
    cfg.Seed = 42;
    return cfg;
}

} // namespace

class SimulatorTest : public ::testing::Test {
protected:
    ECSSimulator sim{smallConfig()};

    void SetUp() override {
        sim.init();
    }
};

TEST(SimulatorConfigTest, InvalidConfigurationThrows) {
    SimulationConfig cfg;
    cfg.System.QuadTreeCapacity = 0;
    EXPECT_THROW(ECSSimulator{cfg}, std::invalid_argument);

    cfg = SimulationConfig();
    cfg.Physics.Drag = 0.0;
    EXPECT_THROW(ECSSimulator{cfg}, std::invalid_argument);

    cfg = SimulationConfig();
    cfg.AudioModel.SamplePoints = 0;
    EXPECT_THROW(ECSSimulator{cfg}, std::invalid_argument);

    cfg = SimulationConfig();
    cfg.GravityStep = -1.0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(SimulatorTest, InitPopulatesWorld) {
    EXPECT_EQ(sim.particleCount(), 120u);
    EXPECT_TRUE(sim.isAudioResponsive());
}

TEST_F(SimulatorTest, TickClampsFrameTimeAndCountsFrames) {
    sim.tick(3.0);
    EXPECT_DOUBLE_EQ(sim.getState().frameSeconds, 0.05);
    sim.tick(-1.0);
    EXPECT_DOUBLE_EQ(sim.getState().frameSeconds, 0.0);
    EXPECT_EQ(sim.getState().frameIndex, 2u);
}

TEST_F(SimulatorTest, ManyFramesStayFiniteAndIndexed) {
    for (int i = 0; i < 300; ++i) {
        sim.tick(1.0 / 60.0);
    }
    auto view = sim.getRegistry().view<const Components::Position, const Components::Velocity>();
    for (auto [e, pos, vel] : view.each()) {
        ASSERT_TRUE(pos.isFinite());
        ASSERT_TRUE(vel.isFinite());
    }
    EXPECT_EQ(sim.getSpatialIndex().size() + sim.droppedLastFrame(), sim.particleCount());

    const auto& audio = sim.getAudioState();
    EXPECT_GE(audio.bass, 0.0);
    EXPECT_LE(audio.bass, 1.0);
}

TEST_F(SimulatorTest, SpawnCommandsGrowPopulation) {
    sim.apply(Command(CommandType::SpawnMixed, 200.0, 200.0));
    EXPECT_EQ(sim.particleCount(), 170u);
    sim.apply(Command(CommandType::SpawnBass, 300.0, 200.0));
    sim.apply(Command(CommandType::SpawnMid, 300.0, 200.0));
    sim.apply(Command(CommandType::SpawnTreble, 300.0, 200.0));
    EXPECT_EQ(sim.particleCount(), 230u);

    sim.tick(1.0 / 60.0);
    EXPECT_EQ(sim.particleCount(), 230u);
}

TEST_F(SimulatorTest, ResetRestoresInitialCount) {
    sim.apply(Command(CommandType::SpawnMixed, 200.0, 200.0));
    sim.apply(Command(CommandType::Reset));
    EXPECT_EQ(sim.particleCount(), 120u);
    sim.tick(1.0 / 60.0);
    EXPECT_EQ(sim.getSpatialIndex().size() + sim.droppedLastFrame(), 120u);
}

TEST_F(SimulatorTest, ToggleAudioFreezesAudioState) {
    sim.tick(0.03);
    sim.apply(Command(CommandType::ToggleAudio));
    EXPECT_FALSE(sim.isAudioResponsive());

    double const elapsed = sim.getAudioModel().getElapsedSeconds();
    sim.tick(0.03);
    EXPECT_DOUBLE_EQ(sim.getAudioModel().getElapsedSeconds(), elapsed);

    sim.apply(Command(CommandType::ToggleAudio));
    EXPECT_TRUE(sim.isAudioResponsive());
}

TEST_F(SimulatorTest, GravityCommandsStepAndFloorAtZero) {
    double const g = sim.getGravity();
    sim.apply(Command(CommandType::GravityUp));
    EXPECT_NEAR(sim.getGravity(), g + 0.02, 1e-12);

    for (int i = 0; i < 20; ++i) {
        sim.apply(Command(CommandType::GravityDown));
    }
    EXPECT_DOUBLE_EQ(sim.getGravity(), 0.0);
}

TEST_F(SimulatorTest, AmplitudeSourceDrivesEnergies) {
    sim.setAmplitudeSource(std::make_unique<ConstantSource>(0.8F));
    sim.tick(0.2);

    EXPECT_FALSE(sim.getAudioModel().usingSyntheticSignal());
    EXPECT_NEAR(sim.getAudioState().bass, 0.8, 1e-6);
    EXPECT_NEAR(sim.getAudioState().treble, 0.8, 1e-6);
    EXPECT_TRUE(sim.getAudioState().beatDetected);

    sim.setAmplitudeSource(nullptr);
    sim.tick(0.01);
    EXPECT_TRUE(sim.getAudioModel().usingSyntheticSignal());
}

TEST(SimulatorDeterminismTest, SameSeedSameTrajectory) {
    ECSSimulator a(smallConfig());
    ECSSimulator b(smallConfig());
    a.init();
    b.init();
    for (int i = 0; i < 60; ++i) {
        a.tick(1.0 / 60.0);
        b.tick(1.0 / 60.0);
    }

    auto va = a.getRegistry().view<const Components::Position>();
    auto vb = b.getRegistry().view<const Components::Position>();
    ASSERT_EQ(va.size(), vb.size());
    auto ia = va.begin();
    auto ib = vb.begin();
    for (; ia != va.end(); ++ia, ++ib) {
        EXPECT_DOUBLE_EQ(va.get<const Components::Position>(*ia).x,
                         vb.get<const Components::Position>(*ib).x);
    }
}
