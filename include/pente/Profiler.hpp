#ifndef PENTE_PROFILER_HPP
#define PENTE_PROFILER_HPP

// ============================================================================
// Profiling Configuration
// ============================================================================
// Disabled by default. Enable via: cmake -DPENTE_ENABLE_PROFILING=ON
// The search is single-threaded, so sections are accumulated in one table.

#ifdef PENTE_ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace pente {

class Profiler {
public:
    struct SectionStats {
        uint64_t callCount = 0;
        double totalTimeNs = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const char* section, double durationNs) {
        auto& stats = sections_[section];
        stats.callCount++;
        stats.totalTimeNs += durationNs;
    }

    void reset() { sections_.clear(); }

    void printReport() const {
        if (sections_.empty()) {
            std::cout << "\n=== Profiler Report ===\n";
            std::cout << "No profiling data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> sorted(sections_.begin(), sections_.end());
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second.totalTimeNs > b.second.totalTimeNs;
        });

        std::cout << "\n";
        std::cout << "================================================================================\n";
        std::cout << "                               PROFILER REPORT                                  \n";
        std::cout << "================================================================================\n";
        std::cout << std::left << std::setw(28) << "Section"
                  << std::right << std::setw(14) << "Total Time"
                  << std::setw(14) << "Calls"
                  << std::setw(14) << "Avg/Call"
                  << "\n";
        std::cout << std::string(80, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            double avgNs = stats.callCount > 0 ? stats.totalTimeNs / stats.callCount : 0.0;
            std::cout << std::left << std::setw(28) << name
                      << std::right << std::setw(11) << std::fixed << std::setprecision(2)
                      << stats.totalTimeNs / 1e6 << " ms"
                      << std::setw(14) << stats.callCount
                      << std::setw(11) << std::fixed << std::setprecision(1) << avgNs << " ns"
                      << "\n";
        }
        std::cout << "================================================================================\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::unordered_map<std::string, SectionStats> sections_;
};

// RAII helper that records timing when it goes out of scope
class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section)
        , start_(std::chrono::steady_clock::now()) {
    }

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

} // namespace pente

#define PENTE_PROFILE_CONCAT_INNER(a, b) a##b
#define PENTE_PROFILE_CONCAT(a, b) PENTE_PROFILE_CONCAT_INNER(a, b)
#define PENTE_PROFILE_SCOPE(name) ::pente::ScopedTimer PENTE_PROFILE_CONCAT(profilerTimer_, __LINE__)(name)

#else // PENTE_ENABLE_PROFILING not defined

namespace pente {

// No-op when profiling is disabled
class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void printReport() const {}
    void reset() {}
};

} // namespace pente

#define PENTE_PROFILE_SCOPE(name) ((void)0)

#endif // PENTE_ENABLE_PROFILING

#endif // PENTE_PROFILER_HPP
