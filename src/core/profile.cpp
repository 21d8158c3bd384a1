/**
 * @file profile.cpp
 * @brief Implementation of the scope timer described in profile.hpp
 */

#include "beatfield/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& stats = instance.sections[name];

    std::string parentName;
    if (!instance.active.empty()) {
        parentName = instance.active.back().name;
    }

    // A section keeps the parent it was first seen under
    if (stats.call_count == 0 && stats.parent_name.empty() && !parentName.empty()) {
        stats.parent_name = parentName;
        auto& siblings = instance.sections[parentName].children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    }

    instance.active.push_back(ActiveSection{name, Clock::now(), Duration{0}});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.active.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") with no open section.\n";
        return;
    }
    if (instance.active.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but innermost section is \"" << instance.active.back().name << "\".\n";
        return;
    }

    ActiveSection const finished = instance.active.back();
    instance.active.pop_back();

    Duration const elapsed = std::chrono::duration_cast<Duration>(Clock::now() - finished.start_time);
    auto& stats = instance.sections[name];
    stats.total_time += elapsed;
    stats.self_time += elapsed - finished.child_time;
    stats.call_count += 1;
    stats.min_time = std::min(stats.min_time, elapsed);
    stats.max_time = std::max(stats.max_time, elapsed);

    if (!instance.active.empty()) {
        instance.active.back().child_time += elapsed;
    }
}

void Profiler::printStats() {
    auto& instance = getInstance();

    std::vector<std::string> roots;
    Duration rootTotal{0};
    for (const auto& [name, stats] : instance.sections) {
        if (stats.parent_name.empty()) {
            roots.push_back(name);
            rootTotal += stats.total_time;
        }
    }
    std::sort(roots.begin(), roots.end(), [&](const std::string& a, const std::string& b) {
        return instance.sections[a].total_time > instance.sections[b].total_time;
    });

    std::cout << "\n[Profiler] Section timings:\n";
    for (const auto& root : roots) {
        printNode(root, 0, rootTotal);
    }
}

void Profiler::printNode(const std::string& name, int indent, Duration rootTotal) {
    const auto& stats = getInstance().sections.at(name);

    double const totalMs = std::chrono::duration<double, std::milli>(stats.total_time).count();
    double const avgUs = stats.call_count > 0
        ? std::chrono::duration<double, std::micro>(stats.total_time).count() / static_cast<double>(stats.call_count)
        : 0.0;
    double const selfPercent = rootTotal.count() > 0
        ? (static_cast<double>(stats.self_time.count()) * 100.0) / static_cast<double>(rootTotal.count())
        : 0.0;

    std::cout << std::string(static_cast<std::size_t>(indent) * 2, ' ')
              << "- " << name << " [" << stats.call_count << " calls] "
              << std::fixed << std::setprecision(2) << totalMs << "ms total, "
              << avgUs << "us avg, self " << selfPercent << "%\n";

    for (const auto& child : stats.children) {
        printNode(child, indent + 1, rootTotal);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    // Sections still open keep running; they are recorded fresh when they end
}

bool Profiler::getStats(const std::string& name, SectionStats& out) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end() || it->second.call_count == 0) {
        return false;
    }
    out = it->second;
    return true;
}

// ------------------ ScopedProfiler ------------------

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
