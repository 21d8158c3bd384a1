/**
 * @file event_manager.hpp
 * @brief Maps SFML window events onto simulator commands and app actions
 */

#pragma once

#include <optional>

#include <SFML/Window/Event.hpp>

#include "beatfield/core/commands.hpp"

/**
 * @brief Things the main loop handles itself rather than the simulator
 */
enum class AppAction {
    None,
    Quit,
    TogglePause,
    StepFrame
};

/**
 * @brief What a single window event turned into
 */
struct InputResult {
    AppAction action = AppAction::None;
    std::optional<Command> command;
};

class EventManager {
public:
    /**
     * @brief Translates one event
     * @param mouseX Cursor x in window coordinates, used by spawn commands
     * @param mouseY Cursor y in window coordinates
     */
    static InputResult translate(const sf::Event& event, double mouseX, double mouseY);

    /**
     * @brief True while the quadtree overlay key is held
     */
    static bool overlayHeld();

private:
    static InputResult translateKey(sf::Keyboard::Key key, double mouseX, double mouseY);
};
