#include "beatfield/core/system_config.hpp"

#include <cmath>
#include <stdexcept>

void validateSystemConfig(const SystemConfig& config) {
    if (!(config.WorldWidth > 0.0) || !std::isfinite(config.WorldWidth)) {
        throw std::invalid_argument("SystemConfig: WorldWidth must be positive and finite");
    }
    if (!(config.WorldHeight > 0.0) || !std::isfinite(config.WorldHeight)) {
        throw std::invalid_argument("SystemConfig: WorldHeight must be positive and finite");
    }
    if (!(config.MaxFrameSeconds > 0.0)) {
        throw std::invalid_argument("SystemConfig: MaxFrameSeconds must be positive");
    }
    if (!(config.ReferenceStepsPerSecond > 0.0)) {
        throw std::invalid_argument("SystemConfig: ReferenceStepsPerSecond must be positive");
    }
    if (config.QuadTreeCapacity < 1) {
        throw std::invalid_argument("SystemConfig: QuadTreeCapacity must be at least 1");
    }
    if (config.QuadTreeMaxDepth < 0) {
        throw std::invalid_argument("SystemConfig: QuadTreeMaxDepth must not be negative");
    }
}
