#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
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

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

Level level_from_string(const std::string& name) {
    const std::string s = StringUtils::to_lower(name);
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
        default:           return "info";
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF"
        };
        auto lvl = static_cast<size_t>(msg.level);
        if (lvl < sizeof(level_names) / sizeof(level_names[0])) {
            dest.append(level_names[lvl], level_names[lvl] + std::strlen(level_names[lvl]));
        } else {
            dest.append("INFO", "INFO" + 4);
        }
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    if (logger) {
        shutdown();
    }

    spdlog::init_thread_pool(8192, 1);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_file.empty()) {
        std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
        if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
            std::filesystem::create_directories(parent_dir);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files));
    }

    logger = std::make_shared<spdlog::async_logger>(
        "genstore_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>(
        "%Y-%m-%d %H:%M:%S.%f %t %X %v"
    );
    formatter->add_flag<LevelFullNameFormatter>('X');

    logger->set_formatter(std::move(formatter));
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    logger.reset();
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

bool is_initialized() {
    return logger != nullptr;
}

void write_fallback(Level level, const std::string& msg) {
    if (level == Level::Debug) {
        return;
    }
    std::cerr << '[' << StringUtils::to_upper(level_to_string(level)) << "] " << msg << std::endl;
}

}
