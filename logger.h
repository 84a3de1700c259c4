#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <atomic>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4
};

// Process-wide log sink shared by the supervisor, its reader threads and the
// host program. Lines look like "[2024-05-01 12:00:00.123] [INFO ] message".
class Logger {
public:
    Logger();
    ~Logger();

    // Configuration
    void set_log_level(LogLevel level);
    void set_log_file(const std::string& filename);
    void set_console_output(bool enable);

    // Apply MCPGROUP_LOG_LEVEL / MCPGROUP_LOG_FILE if present
    void configure_from_env();

    // Parse "debug", "WARN", ... Returns false on unknown names.
    static bool parse_level(const std::string& name, LogLevel& level);

    // Lets callers skip building messages nobody will see
    bool is_enabled(LogLevel level) const { return level >= min_log_level_.load(); }

    // Logging methods
    void log(LogLevel level, const std::string& message);
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Singleton access
    static Logger& instance();

private:
    std::atomic<LogLevel> min_log_level_;
    bool console_output_enabled_;
    bool file_output_enabled_;
    std::unique_ptr<std::ofstream> log_file_;
    std::string log_filename_;
    mutable std::mutex log_mutex_;
    bool is_destructing_ = false;

    std::string get_timestamp() const;
    std::string level_to_string(LogLevel level) const;
    void write_log(LogLevel level, const std::string& message);
};

// Convenience macros for global logger access
#define LOG_TRACE(msg) Logger::instance().trace(msg)
#define LOG_DEBUG(msg) Logger::instance().debug(msg)
#define LOG_INFO(msg) Logger::instance().info(msg)
#define LOG_WARN(msg) Logger::instance().warn(msg)
#define LOG_ERROR(msg) Logger::instance().error(msg)
