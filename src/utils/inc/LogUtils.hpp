#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <iostream>
#include <string>
#include <memory>

// All console output goes to stderr: stdout is reserved for exported CSV data.
namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Accepts debug/info/warn/error/fatal in any case
Level level_from_string(const std::string& name);
const char* level_to_string(Level level);

// Initialize the log system. An empty log_file disables the rotating file sink.
void init(Level level = Level::Info,
          const std::string& log_file = "log/genstore.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);
bool is_initialized();

// Logger instance, null before init() and after shutdown()
extern std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum to_spdlog_level(Level level);

// Plain stderr line used while no logger exists; debug messages are dropped
void write_fallback(Level level, const std::string& msg);

template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    } else if (level != Level::Debug) {
        write_fallback(level, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Fatal, fmt, std::forward<Args>(args)...);
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/genstore.log",
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
