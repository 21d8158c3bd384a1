#include "beatfield/core/commands.hpp"

const char* commandName(CommandType type) {
    switch (type) {
        case CommandType::SpawnMixed:  return "SpawnMixed";
        case CommandType::SpawnBass:   return "SpawnBass";
        case CommandType::SpawnMid:    return "SpawnMid";
        case CommandType::SpawnTreble: return "SpawnTreble";
        case CommandType::ToggleAudio: return "ToggleAudio";
        case CommandType::Reset:       return "Reset";
        case CommandType::GravityUp:   return "GravityUp";
        case CommandType::GravityDown: return "GravityDown";
    }
    return "Unknown";
}
