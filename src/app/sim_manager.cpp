/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, the application frame loop.
 */

#include "beatfield/app/sim_manager.hpp"

#include <iostream>
#include <memory>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>
#include <SFML/Window/Mouse.hpp>

#include "beatfield/app/event_manager.hpp"
#include "beatfield/app/sfml_music_source.hpp"
#include "beatfield/core/constants.hpp"
#include "beatfield/core/debug.hpp"
#include "beatfield/core/profile.hpp"

SimManager::SimManager(const SimulationConfig& config)
    : renderer(static_cast<int>(config.System.WorldWidth),
               static_cast<int>(config.System.WorldHeight))
    , simulator(config)
{
}

bool SimManager::init() {
    if (!renderer.init()) {
        std::cerr << "[SimManager] Renderer initialization failed." << std::endl;
        return false;
    }

    auto music = std::make_unique<SfmlMusicSource>();
    if (music->load(SfmlMusicSource::defaultCandidates())) {
        simulator.setAmplitudeSource(std::move(music));
    } else {
        simulator.setAmplitudeSource(nullptr);
    }

    simulator.init();
    return true;
}

void SimManager::run() {
    sf::Clock frameClock;
    sf::Clock fpsClock;
    sf::Clock profileClock;
    int frames = 0;
    float fps = 0.0F;

    while (running && renderer.getWindow().isOpen()) {
        double const dt = frameClock.restart().asSeconds();

        if (!handleEvents()) {
            break;
        }

        tick(dt);
        render(fps);

        ++frames;
        float const elapsed = fpsClock.getElapsedTime().asSeconds();
        if (elapsed >= 1.0F) {
            fps = static_cast<float>(frames) / elapsed;
            frames = 0;
            fpsClock.restart();
        }

        if (profileClock.getElapsedTime().asSeconds() >=
            SimulatorConstants::ProfilerPrintIntervalSeconds) {
            Profiling::Profiler::printStats();
            Profiling::Profiler::reset();
            DebugStats::printFrameStats();
            profileClock.restart();
        }
    }

    renderer.getWindow().close();
}

bool SimManager::handleEvents() {
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event)) {
        sf::Vector2i const mouse = sf::Mouse::getPosition(window);
        InputResult const input = EventManager::translate(event, mouse.x, mouse.y);

        switch (input.action) {
            case AppAction::Quit:
                running = false;
                break;
            case AppAction::TogglePause:
                togglePause();
                break;
            case AppAction::StepFrame:
                stepOnce();
                break;
            case AppAction::None:
                break;
        }

        if (input.command) {
            simulator.apply(*input.command);
            if (input.command->type == CommandType::Reset) {
                paused = false;
            }
        }
    }
    return running;
}

void SimManager::tick(double dt) {
    if (!paused || stepFrame) {
        // A single step while paused uses a nominal frame
        double const step = paused ? 1.0 / SimulatorConstants::TargetFramesPerSecond : dt;
        simulator.tick(step);
        stepFrame = false;
    }
}

void SimManager::render(float fps) {
    PROFILE_SCOPE("SimManager::render");

    const auto& audio = simulator.getAudioState();
    bool const responsive = simulator.isAudioResponsive();

    renderer.clear(responsive && audio.beatDetected);
    renderer.renderFloorBand(SimulatorConstants::FloorBandHeight);
    renderer.renderParticles(simulator.getRegistry(), audio);

    if (EventManager::overlayHeld()) {
        renderer.renderQuadTree(simulator.getSpatialIndex());
    }
    if (responsive) {
        renderer.renderAudioPanel(simulator.getAudioModel());
    }
    renderer.renderLegend();

    HudInfo info;
    info.fps = fps;
    info.particles = simulator.particleCount();
    info.droppedInserts = simulator.droppedLastFrame();
    info.gravity = simulator.getGravity();
    info.audioResponsive = responsive;
    info.syntheticAudio = simulator.getAmplitudeSource() == nullptr;
    info.paused = paused;
    renderer.renderHud(info);

    renderer.present();
}

void SimManager::togglePause() {
    paused = !paused;
}

void SimManager::stepOnce() {
    if (paused) {
        stepFrame = true;
    }
}
