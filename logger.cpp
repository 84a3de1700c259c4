#include "logger.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <algorithm>
#include <cctype>

Logger::Logger()
    : min_log_level_(LogLevel::INFO)
    , console_output_enabled_(true)
    , file_output_enabled_(false)
    , log_file_(nullptr) {
}

Logger::~Logger() {
    is_destructing_ = true;
    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }
}

void Logger::set_log_level(LogLevel level) {
    min_log_level_ = level;
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }

    log_filename_ = filename;
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);

    if (log_file_->is_open()) {
        file_output_enabled_ = true;
        // Write session start marker
        *log_file_ << "\n=== mcpgroup Log Session Started at " << get_timestamp() << " ===\n";
        log_file_->flush();
    } else {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        file_output_enabled_ = false;
    }
}

void Logger::set_console_output(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TRACE") level = LogLevel::TRACE;
    else if (upper == "DEBUG") level = LogLevel::DEBUG;
    else if (upper == "INFO") level = LogLevel::INFO;
    else if (upper == "WARN" || upper == "WARNING") level = LogLevel::WARN;
    else if (upper == "ERROR") level = LogLevel::ERROR;
    else return false;

    return true;
}

void Logger::configure_from_env() {
    const char* level_env = getenv("MCPGROUP_LOG_LEVEL");
    if (level_env && level_env[0] != '\0') {
        LogLevel level;
        if (parse_level(level_env, level)) {
            set_log_level(level);
        } else {
            warn("Ignoring unknown MCPGROUP_LOG_LEVEL: " + std::string(level_env));
        }
    }

    const char* file_env = getenv("MCPGROUP_LOG_FILE");
    if (file_env && file_env[0] != '\0' && log_filename_ != file_env) {
        set_log_file(file_env);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (is_enabled(level)) {
        write_log(level, message);
    }
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::level_to_string(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

void Logger::write_log(LogLevel level, const std::string& message) {
    // Don't try to log if we're being destroyed (prevents mutex errors during static destruction)
    if (is_destructing_) {
        return;
    }

    std::lock_guard<std::mutex> lock(log_mutex_);

    std::string timestamp = get_timestamp();
    std::string level_str = level_to_string(level);

    // Format: [TIMESTAMP] [LEVEL] MESSAGE
    std::string formatted_message = "[" + timestamp + "] [" + level_str + "] " + message;

    if (console_output_enabled_) {
        // WARN and ERROR go to stderr to avoid polluting stdout
        if (level >= LogLevel::WARN) {
            std::cerr << formatted_message << "\n";
        } else {
            std::cout << formatted_message << "\n";
        }
    }

    // Output to file if enabled and file is open
    if (file_output_enabled_ && log_file_ && log_file_->is_open()) {
        *log_file_ << formatted_message << std::endl;
        log_file_->flush();
    }
}
