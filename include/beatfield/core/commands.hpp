/**
 * @file commands.hpp
 * @brief Input-independent requests the host forwards to the simulator
 */

#pragma once

/**
 * @brief What a command asks the simulator to do
 */
enum class CommandType {
    SpawnMixed,     // mixed burst at (x, y)
    SpawnBass,
    SpawnMid,
    SpawnTreble,
    ToggleAudio,
    Reset,
    GravityUp,
    GravityDown
};

/**
 * @brief A single user request; x and y are only read by the spawn commands
 */
struct Command {
    CommandType type;
    double x = 0.0;
    double y = 0.0;

    Command(CommandType type, double x = 0.0, double y = 0.0)
        : type(type), x(x), y(y) {}
};

/**
 * @brief Short name used when logging a command
 */
const char* commandName(CommandType type);
