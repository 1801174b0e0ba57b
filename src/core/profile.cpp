/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "diagramsim/core/profile.hpp"

#include <iomanip>
#include <ostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration duration) {
    auto& section = getInstance().sections[name];
    section.total_time += duration;
    section.call_count += 1;
    if (duration < section.min_time) {
        section.min_time = duration;
    }
    if (duration > section.max_time) {
        section.max_time = duration;
    }
}

Profiler::SectionStats Profiler::stats(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return {};
    }
    return it->second;
}

void Profiler::printStats(std::ostream& out) {
    out << "\nProfiling Statistics:\n";
    for (const auto& [name, s] : getInstance().sections) {
        auto const totalUs = std::chrono::duration_cast<std::chrono::microseconds>(s.total_time).count();
        double const meanUs = s.call_count > 0
            ? static_cast<double>(totalUs) / static_cast<double>(s.call_count)
            : 0.0;
        out << "  " << name << " [" << s.call_count << " calls] "
            << totalUs << "us total, "
            << std::fixed << std::setprecision(2) << meanUs << "us mean\n";
    }
}

void Profiler::reset() {
    getInstance().sections.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , start_time(Profiler::Clock::now())
{
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(section_name,
        std::chrono::duration_cast<Profiler::Duration>(Profiler::Clock::now() - start_time));
}

} // namespace Profiling
