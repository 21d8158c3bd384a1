/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "beatfield/core/simulator.hpp"

#include <algorithm>
#include <iostream>

#include "beatfield/core/debug.hpp"
#include "beatfield/core/profile.hpp"

namespace {

std::mt19937 makeGenerator(uint32_t seed) {
    if (seed != 0) {
        return std::mt19937(seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}

Entities::SpawnArea spawnArea(const SimulationConfig& config) {
    Entities::SpawnArea area;
    area.width = config.System.WorldWidth;
    area.height = config.System.WorldHeight;
    return area;
}

const SimulationConfig& validated(const SimulationConfig& config) {
    config.validate();
    return config;
}

} // namespace

ECSSimulator::ECSSimulator(const SimulationConfig& cfg)
    : config(validated(cfg))
    , audioModel(config.AudioModel)
    , rng(makeGenerator(config.Seed))
{
    physics.setSystemConfig(config.System);
    physics.setPhysicsConfig(config.Physics);
    ensureStateEntity();
}

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::ensureStateEntity() {
    if (stateEntity != entt::null && registry.valid(stateEntity)) {
        return;
    }
    stateEntity = registry.create();
    registry.emplace<Components::SimulatorState>(stateEntity, 0.0, true);
    registry.emplace<Components::AudioState>(stateEntity);
}

void ECSSimulator::init() {
    ensureStateEntity();
    Entities::ParticleFactory::populate(registry, rng, config.InitialParticleCount, spawnArea(config));
    std::cout << "[Simulator] Initialised with " << particleCount() << " particles" << std::endl;
}

void ECSSimulator::reset() {
    ensureStateEntity();
    Entities::ParticleFactory::clear(registry);
    Entities::ParticleFactory::populate(registry, rng, config.InitialParticleCount, spawnArea(config));
    std::cout << "[Simulator] Reset to " << particleCount() << " particles" << std::endl;
}

void ECSSimulator::tick(double dt) {
    PROFILE_SCOPE("ECSSimulator::tick");
    ensureStateEntity();

    auto& state = registry.get<Components::SimulatorState>(stateEntity);
    state.frameSeconds = physics.clampFrameSeconds(dt);
    state.frameIndex++;

    if (state.audioResponsive) {
        PROFILE_SCOPE("AudioEnergyModel");
        audioModel.update(state.frameSeconds, amplitudeSource.get());

        auto& audio = registry.get<Components::AudioState>(stateEntity);
        audio.bass = audioModel.getBassEnergy();
        audio.mid = audioModel.getMidEnergy();
        audio.treble = audioModel.getTrebleEnergy();
        audio.beatDetected = audioModel.isBeatDetected();
    }

    physics.update(registry);
    DebugStats::recordFrame();
}

void ECSSimulator::apply(const Command& command) {
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Simulator] " << commandName(command.type) << "\n");

    switch (command.type) {
        case CommandType::SpawnMixed:
        case CommandType::SpawnBass:
        case CommandType::SpawnMid:
        case CommandType::SpawnTreble:
            spawn(command);
            break;
        case CommandType::ToggleAudio: {
            ensureStateEntity();
            auto& state = registry.get<Components::SimulatorState>(stateEntity);
            state.audioResponsive = !state.audioResponsive;
            std::cout << "[Simulator] Audio response "
                      << (state.audioResponsive ? "ON" : "OFF") << std::endl;
            break;
        }
        case CommandType::Reset:
            reset();
            break;
        case CommandType::GravityUp:
            setGravity(config.Physics.Gravity + config.GravityStep);
            break;
        case CommandType::GravityDown:
            setGravity(config.Physics.Gravity - config.GravityStep);
            break;
    }
}

void ECSSimulator::spawn(const Command& command) {
    auto const area = spawnArea(config);
    switch (command.type) {
        case CommandType::SpawnMixed:
            Entities::ParticleFactory::spawnMixed(registry, rng, area, command.x, command.y);
            break;
        case CommandType::SpawnBass:
            Entities::ParticleFactory::spawnCategory(registry, rng, area,
                Components::BandCategory::Bass, command.x, command.y);
            break;
        case CommandType::SpawnMid:
            Entities::ParticleFactory::spawnCategory(registry, rng, area,
                Components::BandCategory::Mid, command.x, command.y);
            break;
        case CommandType::SpawnTreble:
            Entities::ParticleFactory::spawnCategory(registry, rng, area,
                Components::BandCategory::Treble, command.x, command.y);
            break;
        default:
            break;
    }
}

void ECSSimulator::setGravity(double gravity) {
    config.Physics.Gravity = std::max(0.0, gravity);
    physics.setPhysicsConfig(config.Physics);
    std::cout << "[Simulator] Gravity " << config.Physics.Gravity << std::endl;
}

void ECSSimulator::setAmplitudeSource(std::unique_ptr<Audio::IAmplitudeSource> source) {
    amplitudeSource = std::move(source);
    if (amplitudeSource && amplitudeSource->isAvailable()) {
        std::cout << "[Audio] Using sample source" << std::endl;
    } else {
        std::cout << "[Audio] No sample source, using synthetic signal" << std::endl;
    }
}

const Components::SimulatorState& ECSSimulator::getState() const {
    return registry.get<Components::SimulatorState>(stateEntity);
}

const Components::AudioState& ECSSimulator::getAudioState() const {
    return registry.get<Components::AudioState>(stateEntity);
}

bool ECSSimulator::isAudioResponsive() const {
    return getState().audioResponsive;
}

std::size_t ECSSimulator::particleCount() const {
    return Entities::ParticleFactory::count(registry);
}
