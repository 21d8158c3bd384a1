#pragma once

#include <cstdint>
#include <iostream>

// Compile with -DBEATFIELD_ENABLE_DEBUG=1 to enable debug output
#ifndef BEATFIELD_ENABLE_DEBUG
#define BEATFIELD_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

#ifndef BEATFIELD_DEBUG_LEVEL
#define BEATFIELD_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

#define DEBUG_MSG(level, x) do { \
    if (BEATFIELD_ENABLE_DEBUG && (level) <= BEATFIELD_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

/**
 * @brief Running counters for the recoverable per-frame failure paths.
 *
 * Nothing here affects the simulation; the counters exist so dropped
 * inserts and degenerate collisions are visible instead of silent.
 */
class DebugStats {
public:
    static void reset() {
        dropped_inserts = 0;
        collision_pairs = 0;
        coincident_pairs = 0;
        beats = 0;
        frames = 0;
    }

    static void recordDroppedInsert() { dropped_inserts++; }
    static void recordCollisionPair() { collision_pairs++; }
    static void recordCoincidentPair() { coincident_pairs++; }
    static void recordBeat() { beats++; }
    static void recordFrame() { frames++; }

    static uint64_t droppedInserts() { return dropped_inserts; }
    static uint64_t collisionPairs() { return collision_pairs; }
    static uint64_t coincidentPairs() { return coincident_pairs; }
    static uint64_t beatCount() { return beats; }
    static uint64_t frameCount() { return frames; }

    static void printFrameStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Frame stats:\n"
            "  Frames: " << frames << "\n"
            "  Dropped inserts: " << dropped_inserts << "\n"
            "  Collision pairs: " << collision_pairs
            << " (coincident: " << coincident_pairs << ")\n"
            "  Beats: " << beats << "\n"
        );
    }

private:
    static uint64_t dropped_inserts;
    static uint64_t collision_pairs;
    static uint64_t coincident_pairs;
    static uint64_t beats;
    static uint64_t frames;
};
