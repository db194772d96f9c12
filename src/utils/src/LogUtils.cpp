#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

namespace {

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Fixed width names, indexed by spdlog level
const char* const level_names[] = {
    "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
};

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

std::unique_ptr<spdlog::formatter> make_formatter(const std::string& pattern) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>(pattern);
    formatter->add_flag<LevelFullNameFormatter>('X');
    return formatter;
}

spdlog::sink_ptr make_file_sink(const std::string& log_file, size_t max_file_size, size_t max_files) {
    const std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
    if (!parent_dir.empty()) {
        std::filesystem::create_directories(parent_dir);
    }

    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);
    sink->set_level(spdlog::level::debug);
    sink->set_formatter(make_formatter("%Y-%m-%d %H:%M:%S.%f %t %X %v"));
    return sink;
}

}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    if (logger) {
        set_level(level);
        return;
    }

    // Console output goes to stderr, stdout belongs to the task containers
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(to_spdlog_level(level));
    console_sink->set_formatter(make_formatter("%X %v"));
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    std::string file_error;
    if (!log_file.empty()) {
        try {
            sinks.push_back(make_file_sink(log_file, max_file_size, max_files));
        } catch (const std::filesystem::filesystem_error& e) {
            file_error = e.what();
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    spdlog::init_thread_pool(8192, 1);
    logger = std::make_shared<spdlog::async_logger>(
        "taskbox_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    // Filtering happens per sink
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        warn("Not writing log file {}: {}", log_file, file_error);
    }
}

void shutdown() {
    if (logger) logger->flush();
    logger.reset();
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->sinks().front()->set_level(to_spdlog_level(level));
}

bool enabled(Level level) {
    if (logger) return logger->should_log(to_spdlog_level(level));
    return level != Level::Debug;
}

void write(Level level, const std::string& msg) {
    if (logger) {
        logger->log(to_spdlog_level(level), msg);
    } else if (level != Level::Debug) {
        const size_t index = static_cast<size_t>(to_spdlog_level(level));
        std::cerr << "[" << StringUtils::trimmed(level_names[index]) << "] " << msg << std::endl;
    }
}

}
