/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for UBNT Discovery.
 *
 * Zero external dependencies. Provides structured logging with
 * configurable levels, component tags, and timestamps.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace ubnt {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Convert LogLevel to its fixed-width tag used in log lines.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name ("TRACE" .. "OFF", case-insensitive).
 * @return The parsed level, or INFO for unknown names.
 */
UBNT_UTILS_API LogLevel parseLogLevel(const std::string& name);

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Scanner", "Found device: {}", source_ip);
 * LOG_WARN("Prober", "System info unavailable for {}", address);
 * @endcode
 */
class UBNT_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Level name without padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    /**
     * @brief Set the minimum log level. Messages below this are ignored.
     */
    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     */
    void setColorEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colorEnabled_ = enabled;
    }

    /**
     * @brief Redirect log output. Passing nullptr restores stderr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    /**
     * @brief Log a message with the given level and component.
     *
     * `{}` placeholders in @p format are replaced by the arguments in order.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_now, &tm_buf);

        std::lock_guard<std::mutex> lock(mutex_);

        std::ostringstream oss;
        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        if (colorEnabled_) {
            oss << getColorCode(level);
        }
        oss << "[" << logLevelToString(level) << "]";
        if (colorEnabled_) {
            oss << "\033[0m";
        }

        oss << " [" << component << "] " << message;

        *out_ << oss.str() << std::endl;
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(true)
        , out_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    const char* getColorCode(LogLevel level) const {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";    // Gray
            case LogLevel::DEBUG: return "\033[36m";    // Cyan
            case LogLevel::INFO:  return "\033[32m";    // Green
            case LogLevel::WARN:  return "\033[33m";    // Yellow
            case LogLevel::ERROR: return "\033[31m";    // Red
            case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
            default:              return "";
        }
    }

    std::atomic<int> level_;
    bool colorEnabled_;
    std::ostream* out_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace ubnt

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::ubnt::utils::Logger::instance().log(::ubnt::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::ubnt::utils::Logger::instance().log(::ubnt::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::ubnt::utils::Logger::instance().log(::ubnt::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::ubnt::utils::Logger::instance().log(::ubnt::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::ubnt::utils::Logger::instance().log(::ubnt::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::ubnt::utils::Logger::instance().log(::ubnt::utils::LogLevel::FATAL, component, __VA_ARGS__)
