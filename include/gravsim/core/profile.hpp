/**
 * @file profile.hpp
 * @brief Scoped timing of simulation passes
 *
 * Each named scope records its call count, total time, self time and the
 * fastest/slowest call. Scopes opened inside other scopes become children,
 * and printStats() writes the result as a tree:
 *
 * @code
 * void GravitySystem::update(...) {
 *     PROFILE_SCOPE("GravitySystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 *
 * The profiler is meant for the thread that drives the simulation; worker
 * threads spawned inside a pass must not open scopes.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collection of scope timings.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics for one named scope
     */
    struct ProfileData {
        Duration total_time{0};        ///< Accumulated total time for this scope
        Duration self_time{0};         ///< Time excluding children
        uint64_t call_count{0};        ///< Number of completed calls
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    /**
     * @brief Opens a scope. Must be closed with endSection(name).
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost scope; warns and ignores a mismatched name.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Writes the scope tree with times and percentages to os.
     */
    static void printStats(std::ostream& os);

    /**
     * @brief Statistics recorded for a scope, if it was ever entered.
     */
    static std::optional<ProfileData> getStats(const std::string& name);

    /**
     * @brief Drops every recorded scope.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    void attachToParent(const std::string& name, SectionData& section);

    void printNode(std::ostream& os,
                   const std::string& name,
                   const std::string& prefix,
                   bool is_last,
                   Duration total_program_time) const;
};

/**
 * @brief RAII guard that opens a scope on construction and closes it on
 *        destruction.
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

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing block under the given scope name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(scopedProfiler_, __LINE__) { name }
