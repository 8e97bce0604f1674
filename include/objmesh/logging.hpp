/**
 * ObjMesh - Logging System
 * 
 * Structured logging with configurable levels.
 * Thread-safe, supports console, file and callback sinks.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>

namespace objmesh {

/**
 * Log severity levels
 */
enum class LogLevel {
    Debug = 0,   // Per-line parser tracing
    Info = 1,    // Pass boundaries, counts
    Warning = 2, // Skipped records, parse diagnostics
    Error = 3,   // Fatal conversion failures
    None = 4     // Disable all logging
};

constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * Parse a level name as written in settings files ("debug", "info", "warn", ...).
 * Returns fallback for unknown names.
 */
inline LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Warning) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none" || name == "off") return LogLevel::None;
    return fallback;
}

/**
 * Thread-safe logger with level filtering
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }
    
    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    /**
     * Set minimum log level (messages below this level are ignored)
     */
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_.store(level, std::memory_order_release);
    }
    
    LogLevel get_level() const {
        return min_level_.load(std::memory_order_acquire);
    }
    
    /**
     * Check if a log level is enabled without taking the lock
     */
    bool is_enabled(LogLevel level) const {
        return level >= min_level_.load(std::memory_order_acquire);
    }
    
    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }
    
    /**
     * Set log file path (truncates an existing file)
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (file_.is_open()) {
            file_.close();
        }
        
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        
        file_.open(path, std::ios::out | std::ios::trunc);
        return file_.is_open();
    }
    
    void close_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }
    
    /**
     * Install a callback receiving every formatted message (tests, embedding tools)
     */
    void set_callback(std::function<void(LogLevel, const std::string&)> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }
    
    template<typename... Args>
    void log(LogLevel level, std::string_view tag, std::string_view format, Args&&... args) {
        if (!is_enabled(level)) return;
        
        std::string message = format_message(level, tag, format, std::forward<Args>(args)...);
        
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (console_enabled_) {
            // Warnings and errors go to stderr so stdout stays clean for summaries
            auto& stream = (level >= LogLevel::Warning) ? std::cerr : std::cout;
            stream << message << std::endl;
        }
        
        if (file_.is_open()) {
            file_ << message << std::endl;
        }
        
        if (callback_) {
            callback_(level, message);
        }
    }
    
    template<typename... Args>
    void debug(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Debug, tag, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Info, tag, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Warning, tag, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void error(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Error, tag, format, std::forward<Args>(args)...);
    }

private:
    // Library default: warnings and errors on the console, no file until asked
    Logger() = default;
    ~Logger() {
        if (file_.is_open()) {
            file_.close();
        }
    }
    
    template<typename... Args>
    std::string format_message(LogLevel level, std::string_view tag, 
                               std::string_view format, Args&&... args) {
        std::ostringstream ss;
        
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        
        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        
        ss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << ' ';
        
        ss << '[' << log_level_string(level) << "] ";
        
        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }
        
        ss << format;
        ((ss << args), ...);
        
        return ss.str();
    }
    
    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Warning};
    bool console_enabled_ = true;
    std::ofstream file_;
    std::function<void(LogLevel, const std::string&)> callback_;
};

// Stream-based logging macros - usage: LOG_INFO("Tag", "message " << value << " more")
#define LOG_DEBUG(tag, msg) \
    do { \
        if (objmesh::Logger::instance().is_enabled(objmesh::LogLevel::Debug)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            objmesh::Logger::instance().debug(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_INFO(tag, msg) \
    do { \
        if (objmesh::Logger::instance().is_enabled(objmesh::LogLevel::Info)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            objmesh::Logger::instance().info(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_WARNING(tag, msg) \
    do { \
        if (objmesh::Logger::instance().is_enabled(objmesh::LogLevel::Warning)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            objmesh::Logger::instance().warn(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_WARN(tag, msg) LOG_WARNING(tag, msg)

#define LOG_ERROR(tag, msg) \
    do { \
        if (objmesh::Logger::instance().is_enabled(objmesh::LogLevel::Error)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            objmesh::Logger::instance().error(tag, _log_ss.str()); \
        } \
    } while(0)

} // namespace objmesh
