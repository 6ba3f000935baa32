#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <cstdint>

#ifdef _WIN32
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#endif

namespace sharebox {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    // Singleton pattern
    static Logger& getInstance();
    
    // Delete copy constructor and assignment operator
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    // Set the minimum log level
    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;
    
    // Enable/disable colors
    void set_colors_enabled(bool enabled);
    
    // Enable/disable timestamps
    void set_timestamps_enabled(bool enabled);
    
    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();
    
    std::string get_level_string(LogLevel level) const;
    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;
    
    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
};

/**
 * Parse a level name ("debug", "info", "warn", "error", case-insensitive)
 * @param name Level name
 * @param level Output level
 * @return true if the name was recognized
 */
bool parse_log_level(const std::string& name, LogLevel& level);

} // namespace sharebox

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        if (sharebox::Logger::getInstance().get_log_level() <= sharebox::LogLevel::DEBUG) { \
            std::ostringstream oss; \
            oss << message; \
            sharebox::Logger::getInstance().log(sharebox::LogLevel::DEBUG, module, oss.str()); \
        } \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        sharebox::Logger::getInstance().log(sharebox::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        sharebox::Logger::getInstance().log(sharebox::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        sharebox::Logger::getInstance().log(sharebox::LogLevel::ERROR, module, oss.str()); \
    } while(0)
