/**
 * @file logger.hpp
 * @brief Thread-safe logging for the timeuuid libraries and tools.
 *
 * Provides leveled logging with component tags and timestamps. Output goes
 * to stderr unless redirected with Logger::setSink().
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/utils/export.hpp"

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace timeuuid {
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
 * @brief Convert LogLevel to its padded string representation.
 */
TIMEUUID_UTILS_API const char* logLevelToString(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive).
 * @param name Level name such as "debug" or "WARN".
 * @param fallback Returned when the name is not recognized.
 */
TIMEUUID_UTILS_API LogLevel logLevelFromString(const std::string& name,
                                               LogLevel fallback = LogLevel::INFO);

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Generator", "Node {} sequence {}", node, sequence);
 * @endcode
 */
class TIMEUUID_UTILS_API Logger {
public:
    static Logger& instance();

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
     * @brief Enable or disable ANSI colors around the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Pass nullptr to restore stderr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setSink(std::ostream* sink);

    /**
     * @brief Log a message. Each "{}" in @p format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream message;
        formatMessage(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void formatMessage(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void formatMessage(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
        while (*format) {
            if (format[0] == '{' && format[1] == '}') {
                oss << value;
                formatMessage(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    void write(LogLevel level, const std::string& component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* sink_;
};

}  // namespace utils
}  // namespace timeuuid

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::timeuuid::utils::Logger::instance().log(::timeuuid::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::timeuuid::utils::Logger::instance().log(::timeuuid::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::timeuuid::utils::Logger::instance().log(::timeuuid::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::timeuuid::utils::Logger::instance().log(::timeuuid::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::timeuuid::utils::Logger::instance().log(::timeuuid::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::timeuuid::utils::Logger::instance().log(::timeuuid::utils::LogLevel::FATAL, component, __VA_ARGS__)
