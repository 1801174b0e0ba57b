/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Sections are timed with an RAII guard and aggregated per name (call count,
 * total, min and max duration). Nested sections are recorded independently.
 *
 * Example usage:
 * @code
 * void normalize() {
 *     PROFILE_SCOPE("SceneNormalizer");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>

namespace Profiling {

/**
 * @brief Collects timing data for the whole process.
 *
 * Singleton; use the static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics for one named section
     */
    struct SectionStats {
        Duration total_time{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        uint64_t call_count{0};
    };

    /**
     * @brief Adds one measured duration to the named section.
     */
    static void record(const std::string& name, Duration duration);

    /**
     * @brief Returns a copy of the statistics for a section, empty if unknown.
     */
    static SectionStats stats(const std::string& name);

    /**
     * @brief Prints every section sorted by name: calls, total and mean in microseconds.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Drops all recorded data.
     */
    static void reset();

private:
    std::map<std::string, SectionStats> sections;

    Profiler() = default;
    static Profiler& getInstance();
};

/**
 * @brief RAII guard that times its own lifetime.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::TimePoint start_time;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
