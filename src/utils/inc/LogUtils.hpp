#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Initialize the log system
void init(Level level = Level::Info,
          const std::string& log_file = "log/stepflow.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);
Level parse_level(const std::string& name);

// Logger instance
extern std::shared_ptr<spdlog::logger> logger;

// String version
void debug(const std::string& msg);
void info(const std::string& msg);
void notice(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void fatal(const std::string& msg);

// Variadic template version (fmt-style)
template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    debug(fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    info(fmt::format(fmt, std::forward<Args>(args)...));
}

// Notices are step headers and operator-facing hints, logged with info severity
template <typename... Args>
inline void notice(fmt::format_string<Args...> fmt, Args&&... args) {
    notice(fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    warn(fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    error(fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    fatal(fmt::format(fmt, std::forward<Args>(args)...));
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/stepflow.log",
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
