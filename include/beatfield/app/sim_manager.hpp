/**
 * @fileoverview sim_manager.hpp
 * @brief Main loop tying the window, the simulator and the music source together
 */

#pragma once

#include "beatfield/core/simulator.hpp"
#include "beatfield/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Owns the renderer and simulator and runs the frame loop.
 */
class SimManager {
public:
    explicit SimManager(const SimulationConfig& config = SimulationConfig());

    /**
     * @brief Opens the window, starts music if present and populates the world
     * @return false if the window could not be created
     */
    bool init();

    /**
     * @brief Runs until the window closes or Escape is pressed
     */
    void run();

    /**
     * @brief Processes window events for the current frame
     * @return false if the application should quit
     */
    bool handleEvents();

    /**
     * @brief Steps the simulation unless paused
     */
    void tick(double dt);

    void render(float fps);

    void togglePause();
    void stepOnce();

private:
    Renderer renderer;
    ECSSimulator simulator;
    bool running = true;
    bool paused = false;
    bool stepFrame = false;
};
