#include "beatfield/app/event_manager.hpp"

#include <SFML/Window/Keyboard.hpp>

InputResult EventManager::translate(const sf::Event& event, double mouseX, double mouseY) {
    if (event.type == sf::Event::Closed) {
        InputResult result;
        result.action = AppAction::Quit;
        return result;
    }
    if (event.type == sf::Event::KeyPressed) {
        return translateKey(event.key.code, mouseX, mouseY);
    }
    return InputResult{};
}

InputResult EventManager::translateKey(sf::Keyboard::Key key, double mouseX, double mouseY) {
    InputResult result;
    switch (key) {
        case sf::Keyboard::Escape:
            result.action = AppAction::Quit;
            break;
        case sf::Keyboard::P:
            result.action = AppAction::TogglePause;
            break;
        case sf::Keyboard::N:
            result.action = AppAction::StepFrame;
            break;
        case sf::Keyboard::Space:
            result.command = Command(CommandType::SpawnMixed, mouseX, mouseY);
            break;
        case sf::Keyboard::Num1:
            result.command = Command(CommandType::SpawnBass, mouseX, mouseY);
            break;
        case sf::Keyboard::Num2:
            result.command = Command(CommandType::SpawnMid, mouseX, mouseY);
            break;
        case sf::Keyboard::Num3:
            result.command = Command(CommandType::SpawnTreble, mouseX, mouseY);
            break;
        case sf::Keyboard::A:
            result.command = Command(CommandType::ToggleAudio);
            break;
        case sf::Keyboard::R:
            result.command = Command(CommandType::Reset);
            break;
        case sf::Keyboard::Up:
            result.command = Command(CommandType::GravityUp);
            break;
        case sf::Keyboard::Down:
            result.command = Command(CommandType::GravityDown);
            break;
        default:
            break;
    }
    return result;
}

bool EventManager::overlayHeld() {
    return sf::Keyboard::isKeyPressed(sf::Keyboard::Q);
}
