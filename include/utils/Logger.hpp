#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Methodical {
namespace Utils {

/**
 * @brief Process-wide logger shared by all OpenMP threads.
 *
 * Line format: [time][T<thread>][LEVEL] <context> message (file:line)
 *
 * Errors and warnings go to stderr, everything else to stdout. ANSI colours
 * are used only when the stream is a terminal; the optional log file gets
 * plain lines. The context is per thread (see LogContext), so messages raised
 * while an anchor is processed name that anchor.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return current_level_.load(); }

    /**
     * @brief True if messages of this level are written.
     *
     * Lets callers skip building expensive per-anchor messages.
     */
    bool enabled(LogLevel level) const { return static_cast<int>(level) <= static_cast<int>(current_level_.load()); }

    /**
     * @brief Appends all further messages to a file, creating parent directories.
     * @throws std::runtime_error if the file cannot be opened.
     */
    void set_log_file(const std::string& filename);

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

    /**
     * @brief Messages written at a level since start-up (or the last reset).
     */
    long count(LogLevel level) const { return counts_[static_cast<int>(level)].load(); }
    void reset_counts();

    /**
     * @brief Maps "error", "warn"/"warning", "info" or "debug" (any case) to a level.
     * @throws std::invalid_argument for other names.
     */
    static LogLevel parse_log_level(const std::string& name);

    static std::string level_to_string(LogLevel level);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> current_level_{LogLevel::LOG_INFO};
    std::array<std::atomic<long>, 4> counts_{};
    std::ofstream log_file_;
    std::mutex mutex_;
    bool stdout_is_tty_;
    bool stderr_is_tty_;

    static std::string format_line(LogLevel level, const std::string& message, const char* file, int line);
    static const char* color_code(LogLevel level);
};

/**
 * @brief Tags every message of the current thread with a context label.
 *
 * Nested contexts restore the outer label on destruction.
 *
 * Usage:
 *   LogContext ctx("ENST0001 chr1:1500:+");
 *   LOG_DEBUG("fetched 42 sites");   // [..][DEBUG] [ENST0001 chr1:1500:+] fetched 42 sites
 */
class LogContext {
public:
    explicit LogContext(const std::string& label);
    ~LogContext();

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

    /**
     * @brief Label of the calling thread, empty outside any context.
     */
    static const std::string& current();

private:
    std::string previous_;
};

/**
 * @brief Logs START and DONE (with elapsed ms) around a pipeline stage.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace Methodical

#define LOG_DEBUG(msg) Methodical::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) Methodical::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) Methodical::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) Methodical::Utils::Logger::error(msg, __FILE__, __LINE__)
