#include "beatfield/core/debug.hpp"

uint64_t DebugStats::dropped_inserts = 0;
uint64_t DebugStats::collision_pairs = 0;
uint64_t DebugStats::coincident_pairs = 0;
uint64_t DebugStats::beats = 0;
uint64_t DebugStats::frames = 0;
