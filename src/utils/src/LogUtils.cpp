#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

static spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF"
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    std::filesystem::path log_path(log_file);
    std::filesystem::path parent_dir = log_path.parent_path();

    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    if (logger) {
        spdlog::drop(logger->name());
        logger.reset();
    }

    // Console output is interleaved with child process output and operator prompts,
    // so the logger is synchronous and flushes every record.
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);
    console_sink->set_pattern("%v");

    auto file_formatter = std::make_unique<spdlog::pattern_formatter>(
        "%Y-%m-%d %H:%M:%S.%f %X %v"
    );
    file_formatter->add_flag<LevelFullNameFormatter>('X');
    file_sink->set_formatter(std::move(file_formatter));

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger = std::make_shared<spdlog::logger>("stepflow_logger", sinks.begin(), sinks.end());

    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::trace);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) {
        logger->flush();
        logger.reset();
    }
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal") return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

void debug(const std::string& msg) {
    if (logger) {
        logger->debug(msg);
    } else {
        std::cout << "[DEBUG] " << msg << std::endl;
    }
}

void info(const std::string& msg) {
    if (logger) {
        logger->info(msg);
    } else {
        std::cout << "[INFO] " << msg << std::endl;
    }
}

void notice(const std::string& msg) {
    if (logger) {
        logger->info(msg);
    } else {
        std::cout << "[NOTICE] " << msg << std::endl;
    }
}

void warn(const std::string& msg) {
    if (logger) {
        logger->warn(msg);
    } else {
        std::cout << "[WARN] " << msg << std::endl;
    }
}

void error(const std::string& msg) {
    if (logger) {
        logger->error(msg);
    } else {
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}

void fatal(const std::string& msg) {
    if (logger) {
        logger->critical(msg);
    } else {
        std::cerr << "[FATAL] " << msg << std::endl;
    }
}

}
