#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <functional>
#include <cstdint>

#ifdef _WIN32
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#endif

namespace xtrans {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Receives every line that passes the level filter.
 * Called with the logger mutex held, so it must not log itself.
 */
using LogSinkCallback = std::function<void(LogLevel level, const std::string& module, const std::string& message)>;

/**
 * Parse a level name ("debug", "info", "warn"/"warning", "error"), case-insensitive.
 * @param name Level name
 * @param level Receives the parsed level
 * @return true if the name was recognised
 */
bool parse_log_level(const std::string& name, LogLevel& level);

const char* log_level_to_string(LogLevel level);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    void set_console_logging_enabled(bool enabled);
    bool is_console_logging_enabled() const;

    /**
     * Install an additional sink (pass nullptr to remove it).
     */
    void set_sink(LogSinkCallback sink);

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool console_enabled_;
    bool is_terminal_;
    LogSinkCallback sink_;
};

} // namespace xtrans

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        xtrans::Logger::getInstance().log(xtrans::LogLevel::DEBUG, module, oss_.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        xtrans::Logger::getInstance().log(xtrans::LogLevel::INFO, module, oss_.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        xtrans::Logger::getInstance().log(xtrans::LogLevel::WARN, module, oss_.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        xtrans::Logger::getInstance().log(xtrans::LogLevel::ERROR, module, oss_.str()); \
    } while(0)
