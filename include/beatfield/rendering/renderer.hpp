/**
 * @file renderer.hpp
 * @brief SFML drawing of particles, audio panel and HUD
 *
 * This system handles:
 * - Background pulse and the floor band
 * - Particle rendering (fill, outline, floor marker, bass highlight)
 * - Quad-tree overlay
 * - Band energy bars, waveform and beat indicator
 * - Legend and status text
 *
 * Everything is read-only with respect to the simulation.
 */

#pragma once

#include <cstddef>
#include <string>

#include <SFML/Graphics.hpp>
#include <entt/entt.hpp>

#include "beatfield/audio/audio_energy_model.hpp"
#include "beatfield/components/sim.hpp"
#include "beatfield/spatial/quad_tree.hpp"

/**
 * @brief Status line values shown in the top-left corner
 */
struct HudInfo {
    float fps = 0.0F;
    std::size_t particles = 0;
    std::size_t droppedInserts = 0;
    double gravity = 0.0;
    bool audioResponsive = true;
    bool syntheticAudio = true;
    bool paused = false;
};

class Renderer {
public:
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the window and loads the font
     * @return false if the window could not be opened
     */
    bool init();

    /**
     * @brief Clears to the background grey, brighter on a beat
     */
    void clear(bool beat);
    void present();

    void renderFloorBand(double floorBandHeight);

    void renderParticles(const entt::registry& registry, const Components::AudioState& audio);

    void renderQuadTree(const Spatial::QuadTree& tree);

    void renderAudioPanel(const Audio::AudioEnergyModel& model);

    void renderLegend();

    void renderHud(const HudInfo& info);

    void renderText(const std::string& text, int x, int y,
                    sf::Color color = sf::Color::White);

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded = false;
    int screenWidth;
    int screenHeight;
};
