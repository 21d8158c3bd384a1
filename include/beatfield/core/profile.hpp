/**
 * @file profile.hpp
 * @brief Scope timing for the per-frame update and draw phases
 *
 * Sections are identified by name and nest according to the order in which
 * they are entered. Timing data accumulates until reset() is called, so the
 * main loop can print a summary every few seconds and start over.
 *
 * Example usage:
 * @code
 * void PhysicsStepSystem::update(entt::registry& registry) {
 *     PROFILE_SCOPE("PhysicsStepSystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide registry of named timing sections.
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics for one named section
     */
    struct SectionStats {
        Duration total_time{0};
        Duration self_time{0};          ///< Time excluding nested sections
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        std::string parent_name;
        std::vector<std::string> children;
    };

    /**
     * @brief Enter a named section. Must be balanced by endSection(name).
     */
    static void startSection(const std::string& name);

    /**
     * @brief Leave the innermost section. Mismatched names are reported on
     *        std::cerr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Print the section tree with call counts, average and total time.
     */
    static void printStats();

    /**
     * @brief Drop all recorded statistics.
     */
    static void reset();

    /**
     * @brief Copy of the statistics recorded for a section, if any.
     * @return true when the section has been entered since the last reset
     */
    static bool getStats(const std::string& name, SectionStats& out);

private:
    struct ActiveSection {
        std::string name;
        Clock::time_point start_time;
        Duration child_time{0};
    };

    std::unordered_map<std::string, SectionStats> sections;
    std::vector<ActiveSection> active;

    Profiler() = default;
    static Profiler& getInstance();

    static void printNode(const std::string& name, int indent, Duration rootTotal);
};

/**
 * @brief RAII guard timing the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define BEATFIELD_PROFILE_CONCAT_INNER(a, b) a##b
#define BEATFIELD_PROFILE_CONCAT(a, b) BEATFIELD_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler BEATFIELD_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
