#include "utils/Logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Methodical {
namespace Utils {

namespace {

thread_local std::string g_context;

}  // namespace

// ==================================================
// Logger
// ==================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : stdout_is_tty_(isatty(STDOUT_FILENO) != 0), stderr_is_tty_(isatty(STDERR_FILENO) != 0) {
    reset_counts();
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

void Logger::set_log_level(LogLevel level) {
    current_level_.store(level);
}

void Logger::reset_counts() {
    for (auto& c : counts_) c.store(0);
}

void Logger::set_log_file(const std::string& filename) {
    std::filesystem::path p(filename);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.open(filename, std::ios::app);
    if (!log_file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename);
    }
}

LogLevel Logger::parse_log_level(const std::string& name) {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "error") return LogLevel::LOG_ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::LOG_WARN;
    if (lower == "info") return LogLevel::LOG_INFO;
    if (lower == "debug") return LogLevel::LOG_DEBUG;
    throw std::invalid_argument("Unknown log level '" + name + "' (expected error, warn, info or debug)");
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_WARN:  return "WARN ";
        case LogLevel::LOG_INFO:  return "INFO ";
        case LogLevel::LOG_DEBUG: return "DEBUG";
    }
    return "?    ";
}

const char* Logger::color_code(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_ERROR: return "\033[31m";
        case LogLevel::LOG_WARN:  return "\033[33m";
        case LogLevel::LOG_INFO:  return "\033[32m";
        case LogLevel::LOG_DEBUG: return "\033[36m";
    }
    return "";
}

std::string Logger::format_line(LogLevel level, const std::string& message, const char* file, int line) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&now_time, &local);

    std::ostringstream ss;
    ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms
       << "]";
#ifdef _OPENMP
    ss << "[T" << omp_get_thread_num() << "]";
#endif
    ss << "[" << level_to_string(level) << "] ";

    if (!g_context.empty()) {
        ss << "[" << g_context << "] ";
    }
    ss << message;

    // Source location only where it helps track a problem down
    if (file != nullptr && (level == LogLevel::LOG_ERROR || level == LogLevel::LOG_DEBUG)) {
        ss << " (" << std::filesystem::path(file).filename().string() << ":" << line << ")";
    }
    ss << "\n";
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!enabled(level)) {
        return;
    }
    counts_[static_cast<int>(level)].fetch_add(1);

    const std::string text = format_line(level, message, file, line);
    const bool to_stderr = level == LogLevel::LOG_ERROR || level == LogLevel::LOG_WARN;
    std::ostream& console = to_stderr ? std::cerr : std::cout;
    const bool colored = to_stderr ? stderr_is_tty_ : stdout_is_tty_;

    std::lock_guard<std::mutex> lock(mutex_);
    if (colored) {
        console << color_code(level) << text << "\033[0m";
    } else {
        console << text;
    }
    console.flush();

    if (log_file_.is_open()) {
        log_file_ << text;
        log_file_.flush();
    }
}

void Logger::debug(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_DEBUG, msg, file, line);
}

void Logger::info(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_INFO, msg, file, line);
}

void Logger::warning(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_WARN, msg, file, line);
}

void Logger::error(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_ERROR, msg, file, line);
}

// ==================================================
// LogContext
// ==================================================

LogContext::LogContext(const std::string& label) : previous_(g_context) {
    g_context = label;
}

LogContext::~LogContext() {
    g_context = previous_;
}

const std::string& LogContext::current() {
    return g_context;
}

// ==================================================
// ScopedLogger
// ==================================================

ScopedLogger::ScopedLogger(const std::string& action_name, LogLevel level)
    : action_name_(action_name), level_(level), start_time_(std::chrono::steady_clock::now()) {
    Logger::instance().log(level_, "START: " + action_name_);
}

ScopedLogger::~ScopedLogger() {
    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    Logger::instance().log(level_, "DONE : " + action_name_ + " (" + std::to_string(ms) + " ms)");
}

}  // namespace Utils
}  // namespace Methodical
