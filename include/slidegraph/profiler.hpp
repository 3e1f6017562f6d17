#pragma once

// Section timing for the graph builder and the distance passes. Compiled in only
// when SLIDEGRAPH_ENABLE_PROFILING is defined (cmake -DSLIDEGRAPH_ENABLE_PROFILING=ON);
// otherwise the macros expand to nothing.

#ifdef SLIDEGRAPH_ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace slidegraph {

class Profiler {
public:
    struct SectionStats {
        uint64_t call_count = 0;
        double total_ns = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const std::string& section, double duration_ns) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stats = sections_[section];
        stats.call_count++;
        stats.total_ns += duration_ns;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
    }

    void print_report(std::ostream& out = std::cout) const {
        std::lock_guard<std::mutex> lock(mutex_);

        out << "\n=== Profiler Report ===\n";
        if (sections_.empty()) {
            out << "No profiling data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> sorted(sections_.begin(), sections_.end());
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second.total_ns > b.second.total_ns;
        });

        out << std::left << std::setw(28) << "Section"
            << std::right << std::setw(14) << "Total Time"
            << std::setw(10) << "Calls" << "\n";
        out << std::string(52, '-') << "\n";
        for (const auto& [name, stats] : sorted) {
            out << std::left << std::setw(28) << name
                << std::right << std::setw(11) << std::fixed << std::setprecision(2)
                << stats.total_ns / 1e6 << " ms"
                << std::setw(10) << stats.call_count << "\n";
        }
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SectionStats> sections_;
};

// Records the lifetime of the enclosing scope
class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        Profiler::instance().record(section_, std::chrono::duration<double, std::nano>(end - start_).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace slidegraph

#define SLIDEGRAPH_PROFILE_CONCAT_INNER(a, b) a##b
#define SLIDEGRAPH_PROFILE_CONCAT(a, b) SLIDEGRAPH_PROFILE_CONCAT_INNER(a, b)
#define SLIDEGRAPH_PROFILE_SCOPE(name) \
    ::slidegraph::ScopedTimer SLIDEGRAPH_PROFILE_CONCAT(profiler_timer_, __LINE__)(name)
#define SLIDEGRAPH_PROFILE_FUNCTION() SLIDEGRAPH_PROFILE_SCOPE(__func__)

#else // SLIDEGRAPH_ENABLE_PROFILING

#include <iostream>

namespace slidegraph {

class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void print_report(std::ostream& = std::cout) const {}
    void reset() {}
};

} // namespace slidegraph

#define SLIDEGRAPH_PROFILE_SCOPE(name) ((void)0)
#define SLIDEGRAPH_PROFILE_FUNCTION() ((void)0)

#endif // SLIDEGRAPH_ENABLE_PROFILING
