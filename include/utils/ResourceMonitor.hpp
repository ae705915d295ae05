#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace Methodical {
namespace Utils {

/**
 * @brief Wall time and memory of a run or a test.
 *
 * Allocated bytes come from jemalloc when built with USE_JEMALLOC; the peak
 * resident set size is always available from getrusage().
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    // Returns allocated memory in bytes, 0 without jemalloc
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    // Peak resident set size of the process in MB
    static double get_peak_rss_mb() {
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0.0;
        }
        return usage.ru_maxrss / 1024.0;  // ru_maxrss is in KB on Linux
    }

    /**
     * @brief "[label] Time: 1.2345 s, Memory: 12.34 MB, Peak RSS: 56.78 MB"
     */
    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream oss;
        oss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        oss << ", Memory: " << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
#endif
        oss << ", Peak RSS: " << std::setprecision(2) << get_peak_rss_mb() << " MB";
        return oss.str();
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace Methodical
