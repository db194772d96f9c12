#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Console output on stderr filtered at `level`, plus a rotating log file that
// always keeps debug detail. An empty `log_file` disables the file; one that
// cannot be opened is reported and logging continues on the console only.
void init(Level level = Level::Info,
          const std::string& log_file = ".taskbox/logs/taskbox.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();

// Console verbosity; the log file is unaffected
void set_level(Level level);

// Logger instance, null until init() has been called
extern std::shared_ptr<spdlog::logger> logger;

bool enabled(Level level);

// Without a logger, Info and above go to stderr and Debug is dropped
void write(Level level, const std::string& msg);

// String version
inline void debug(const std::string& msg) { write(Level::Debug, msg); }
inline void info(const std::string& msg)  { write(Level::Info, msg); }
inline void warn(const std::string& msg)  { write(Level::Warn, msg); }
inline void error(const std::string& msg) { write(Level::Error, msg); }
inline void fatal(const std::string& msg) { write(Level::Fatal, msg); }

// Variadic template version (fmt-style)
template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level)) {
        write(level, fmt::format(fmt, std::forward<Args>(args)...));
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

}
