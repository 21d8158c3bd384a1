#include "beatfield/rendering/renderer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#include "beatfield/components/basic.hpp"
#include "beatfield/core/profile.hpp"

namespace {

sf::Uint8 scaleChannel(sf::Uint8 c, double factor) {
    double const v = std::min(255.0, std::max(0.0, c * factor));
    return static_cast<sf::Uint8>(v);
}

sf::Color toSfColor(const Components::Color& c) {
    return {c.r, c.g, c.b};
}

const sf::Color BassColor(204, 51, 51);
const sf::Color MidColor(51, 204, 51);
const sf::Color TrebleColor(51, 51, 204);

} // namespace

Renderer::Renderer(int screenWidth, int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Beatfield");
    if (!window.isOpen()) {
        std::cerr << "[Renderer] Failed to create window" << std::endl;
        return false;
    }
    window.setFramerateLimit(60);

    fontLoaded = font.loadFromFile("assets/fonts/arial.ttf");
    if (!fontLoaded) {
        std::cerr << "[Renderer] Failed to load font assets/fonts/arial.ttf, text disabled" << std::endl;
    }
    return true;
}

void Renderer::clear(bool beat) {
    sf::Uint8 const grey = beat ? 38 : 13;   // 0.15 and 0.05 intensity
    window.clear(sf::Color(grey, grey, grey));
}

void Renderer::present() {
    window.display();
}

void Renderer::renderFloorBand(double floorBandHeight) {
    auto const band = static_cast<float>(floorBandHeight);
    sf::RectangleShape rect(sf::Vector2f(static_cast<float>(screenWidth), band));
    rect.setPosition(0.F, static_cast<float>(screenHeight) - band);
    rect.setFillColor(sf::Color(38, 38, 38));
    window.draw(rect);
}

void Renderer::renderParticles(const entt::registry& registry, const Components::AudioState& audio) {
    PROFILE_SCOPE("Renderer::renderParticles");

    sf::VertexArray floorMarkers(sf::Lines);

    auto view = registry.view<const Components::Position, const Components::Radius,
                              const Components::Category, const Components::Color,
                              const Components::FloorLevel, const Components::BounceEnergy>();

    for (auto [entity, pos, radius, category, color, floor, bounce] : view.each()) {
        sf::Color fill = toSfColor(color);
        double size = radius.value;

        if (category.band == Components::BandCategory::Bass) {
            double intensity = 1.0 + audio.bass * 0.5;
            if (audio.beatDetected) {
                intensity += 0.5;
            }
            fill.r = scaleChannel(fill.r, intensity);
            size = radius.value * (1.0 + bounce.value * 0.05);
        }

        auto const r = static_cast<float>(size);
        sf::CircleShape circle(r);
        circle.setOrigin(r, r);
        circle.setPosition(static_cast<float>(pos.x), static_cast<float>(pos.y));
        circle.setFillColor(fill);
        circle.setOutlineThickness(1.F);
        circle.setOutlineColor(sf::Color(scaleChannel(fill.r, 0.7),
                                         scaleChannel(fill.g, 0.7),
                                         scaleChannel(fill.b, 0.7)));
        window.draw(circle);

        sf::Color const marker(scaleChannel(fill.r, 0.3), scaleChannel(fill.g, 0.3),
                               scaleChannel(fill.b, 0.3), 26);
        auto const fy = static_cast<float>(floor.y);
        floorMarkers.append(sf::Vertex(sf::Vector2f(static_cast<float>(pos.x - radius.value), fy), marker));
        floorMarkers.append(sf::Vertex(sf::Vector2f(static_cast<float>(pos.x + radius.value), fy), marker));
    }

    window.draw(floorMarkers);
}

void Renderer::renderQuadTree(const Spatial::QuadTree& tree) {
    sf::Color const outline(255, 255, 255, 77);
    tree.forEachRegion([&](const Spatial::Region& region, int, bool, std::size_t) {
        sf::RectangleShape rect(sf::Vector2f(static_cast<float>(region.width()),
                                             static_cast<float>(region.height())));
        rect.setPosition(static_cast<float>(region.getMinX()), static_cast<float>(region.getMinY()));
        rect.setFillColor(sf::Color::Transparent);
        rect.setOutlineColor(outline);
        rect.setOutlineThickness(1.F);
        window.draw(rect);
    });
}

void Renderer::renderAudioPanel(const Audio::AudioEnergyModel& model) {
    auto const h = static_cast<float>(screenHeight);

    struct Bar { float x; double energy; sf::Color color; const char* label; };
    const std::vector<Bar> bars = {
        {10.F, model.getBassEnergy(),   sf::Color(204, 51, 51, 179), "Bass"},
        {50.F, model.getMidEnergy(),    sf::Color(51, 204, 51, 179), "Mid"},
        {90.F, model.getTrebleEnergy(), sf::Color(51, 51, 204, 179), "Treble"}
    };
    for (const auto& bar : bars) {
        sf::RectangleShape rect(sf::Vector2f(30.F, static_cast<float>(100.0 * bar.energy)));
        rect.setPosition(bar.x, h - 120.F);
        rect.setFillColor(bar.color);
        window.draw(rect);
        renderText(bar.label, static_cast<int>(bar.x), screenHeight - 140);
    }

    const auto& wave = model.getWaveform();
    sf::VertexArray line(sf::LineStrip, wave.size());
    for (std::size_t i = 0; i < wave.size(); ++i) {
        line[i].position = sf::Vector2f(151.F + static_cast<float>(i),
                                        h - 70.F - static_cast<float>(wave[i] * 50.0));
        line[i].color = sf::Color(128, 204, 255, 128);
    }
    window.draw(line);

    if (model.isBeatDetected()) {
        sf::CircleShape beat(10.F);
        beat.setOrigin(10.F, 10.F);
        beat.setPosition(150.F, h - 80.F);
        beat.setFillColor(sf::Color(255, 51, 51));
        window.draw(beat);
    }
}

void Renderer::renderLegend() {
    auto const x = static_cast<float>(screenWidth - 100);
    const std::vector<std::pair<sf::Color, std::string>> entries = {
        {BassColor, "Bass"}, {MidColor, "Mid"}, {TrebleColor, "Treble"}
    };

    float y = 20.F;
    for (const auto& entry : entries) {
        sf::CircleShape dot(8.F);
        dot.setOrigin(8.F, 8.F);
        dot.setPosition(x, y);
        dot.setFillColor(entry.first);
        window.draw(dot);
        renderText(entry.second, screenWidth - 80, static_cast<int>(y) - 8);
        y += 20.F;
    }
}

void Renderer::renderHud(const HudInfo& info) {
    std::stringstream fps;
    fps << std::fixed << std::setprecision(1) << info.fps << " FPS";
    renderText(fps.str(), 10, 10);
    renderText("Particles: " + std::to_string(info.particles), 10, 30);

    std::stringstream gravity;
    gravity << std::fixed << std::setprecision(2) << "Gravity: " << info.gravity
            << "  (Up/Down to adjust)";
    renderText(gravity.str(), 10, 50);

    renderText("Hold 'q' to show the quadtree", 10, 70);
    renderText("Space: add particles  R: reset  P: pause  N: step", 10, 90);
    renderText(std::string("A: toggle audio response: ") + (info.audioResponsive ? "ON" : "OFF"), 10, 110);
    renderText("1/2/3: add bass/mid/treble particles", 10, 130);

    if (info.droppedInserts > 0) {
        renderText("Dropped from index: " + std::to_string(info.droppedInserts), 10, 150,
                   sf::Color(255, 128, 128));
    }
    if (info.paused) {
        renderText("PAUSED", screenWidth / 2 - 30, 10, sf::Color::Yellow);
    }
    if (info.syntheticAudio) {
        sf::Color const notice(255, 128, 128);
        renderText("Place a music.ogg file in the working directory for real audio response",
                   10, screenHeight - 50, notice);
        renderText("Currently using simulated audio data", 10, screenHeight - 30, notice);
    }
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(14);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
