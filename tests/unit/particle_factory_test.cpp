#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <entt/entt.hpp>
#include "beatfield/components/basic.hpp"
#include "beatfield/components/sim.hpp"
#include "beatfield/entities/particle_factory.hpp"

using namespace Entities;
using Components::BandCategory;

class ParticleFactoryTest : public ::testing::Test {
protected:
    entt::registry registry;
    std::mt19937 rng{1234};
    SpawnArea area;
};

TEST_F(ParticleFactoryTest, CreateParticleAttachesAllComponents) {
    ParticleSpec spec;
    spec.position = Components::Position(10.0, 20.0);
    spec.velocity = Components::Velocity(1.0, -1.0);
    spec.mass = 3.0;
    spec.radius = 3.0;
    spec.band = BandCategory::Treble;
    spec.floorY = 575.0;

    auto e = ParticleFactory::createParticle(registry, spec);

    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(e).x, 10.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(e).y, -1.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Mass>(e).value, 3.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Radius>(e).value, 3.0);
    EXPECT_EQ(registry.get<Components::Category>(e).band, BandCategory::Treble);
    EXPECT_DOUBLE_EQ(registry.get<Components::FloorLevel>(e).y, 575.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::BounceEnergy>(e).value, 0.0);
    EXPECT_EQ(registry.get<Components::Color>(e).b, 204);
}

TEST_F(ParticleFactoryTest, CreateParticleRejectsBadSpecs) {
    ParticleSpec spec;
    spec.mass = 0.5;
    EXPECT_THROW(ParticleFactory::createParticle(registry, spec), std::invalid_argument);

    spec = ParticleSpec();
    spec.radius = 0.0;
    EXPECT_THROW(ParticleFactory::createParticle(registry, spec), std::invalid_argument);

    spec = ParticleSpec();
    spec.position = Components::Position(std::numeric_limits<double>::quiet_NaN(), 0.0);
    EXPECT_THROW(ParticleFactory::createParticle(registry, spec), std::invalid_argument);

    EXPECT_EQ(ParticleFactory::count(registry), 0u);
}

TEST_F(ParticleFactoryTest, PopulateMatchesInitialRanges) {
    ParticleFactory::populate(registry, rng, 500, area);
    EXPECT_EQ(ParticleFactory::count(registry), 500u);

    int perBand[3] = {0, 0, 0};
    auto view = registry.view<Components::Position, Components::Velocity, Components::Mass,
                              Components::Radius, Components::Category, Components::FloorLevel>();
    for (auto [e, pos, vel, mass, radius, category, floor] : view.each()) {
        EXPECT_GE(pos.x, 1.0);
        EXPECT_LE(pos.x, area.width);
        EXPECT_GE(pos.y, 1.0);
        EXPECT_LE(pos.y, area.height);
        EXPECT_DOUBLE_EQ(pos.x, std::floor(pos.x));
        EXPECT_GE(vel.x, -1.0);
        EXPECT_LT(vel.x, 1.0);
        EXPECT_GE(mass.value, 1.0);
        EXPECT_LE(mass.value, 4.0);
        EXPECT_DOUBLE_EQ(radius.value, 3.0);
        EXPECT_GT(floor.y, area.height - 50.0);
        EXPECT_LE(floor.y, area.height);
        perBand[static_cast<int>(category.band)]++;
    }
    for (int count : perBand) {
        EXPECT_GT(count, 100);
    }
}

TEST_F(ParticleFactoryTest, MixedBurstSpawnsAtCursor) {
    ParticleFactory::spawnMixed(registry, rng, area, 321.0, 123.0);
    EXPECT_EQ(ParticleFactory::count(registry), 50u);

    auto view = registry.view<Components::Position, Components::Velocity>();
    for (auto [e, pos, vel] : view.each()) {
        EXPECT_DOUBLE_EQ(pos.x, 321.0);
        EXPECT_DOUBLE_EQ(pos.y, 123.0);
        EXPECT_GE(vel.x, -2.5);
        EXPECT_LT(vel.x, 2.5);
    }
}

TEST_F(ParticleFactoryTest, CategoryBurstUsesBandMassRange) {
    ParticleFactory::spawnCategory(registry, rng, area, BandCategory::Bass, 400.0, 300.0);
    ParticleFactory::spawnCategory(registry, rng, area, BandCategory::Treble, 400.0, 300.0);
    EXPECT_EQ(ParticleFactory::count(registry), 40u);

    auto view = registry.view<Components::Position, Components::Mass, Components::Category>();
    for (auto [e, pos, mass, category] : view.each()) {
        auto const range = ParticleFactory::massRange(category.band);
        EXPECT_GE(mass.value, range.first);
        EXPECT_LE(mass.value, range.second);
        EXPECT_LE(std::fabs(pos.x - 400.0), 20.0);
        EXPECT_LE(std::fabs(pos.y - 300.0), 20.0);
        EXPECT_NE(category.band, BandCategory::Mid);
    }
}

TEST_F(ParticleFactoryTest, BaseColorsPerBand) {
    auto bass = ParticleFactory::baseColor(BandCategory::Bass);
    auto mid = ParticleFactory::baseColor(BandCategory::Mid);
    auto treble = ParticleFactory::baseColor(BandCategory::Treble);
    EXPECT_EQ(bass.r, 204);
    EXPECT_EQ(bass.g, 51);
    EXPECT_EQ(mid.g, 204);
    EXPECT_EQ(treble.b, 204);
    EXPECT_EQ(treble.r, 51);
}

TEST_F(ParticleFactoryTest, ClearLeavesStateEntityAlone) {
    auto state = registry.create();
    registry.emplace<Components::SimulatorState>(state);

    ParticleFactory::populate(registry, rng, 25, area);
    ParticleFactory::clear(registry);

    EXPECT_EQ(ParticleFactory::count(registry), 0u);
    EXPECT_TRUE(registry.valid(state));
    EXPECT_TRUE(registry.all_of<Components::SimulatorState>(state));
}

TEST_F(ParticleFactoryTest, SameSeedSamePopulation) {
    entt::registry other;
    std::mt19937 rngA(77);
    std::mt19937 rngB(77);
    ParticleFactory::populate(registry, rngA, 30, area);
    ParticleFactory::populate(other, rngB, 30, area);

    auto a = registry.view<Components::Position>();
    auto b = other.view<Components::Position>();
    ASSERT_EQ(a.size(), b.size());

    auto itA = a.begin();
    auto itB = b.begin();
    for (; itA != a.end(); ++itA, ++itB) {
        EXPECT_DOUBLE_EQ(a.get<Components::Position>(*itA).x, b.get<Components::Position>(*itB).x);
        EXPECT_DOUBLE_EQ(a.get<Components::Position>(*itA).y, b.get<Components::Position>(*itB).y);
    }
}
