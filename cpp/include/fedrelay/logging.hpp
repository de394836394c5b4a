#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace fedrelay {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Process-wide logger. Wraps a spdlog logger with a colour console sink and an
 * optional file sink configured from `logging.file`.
 */
class Logger {
public:
    static Logger& getInstance();

    spdlog::logger& get() { return *logger_; }

    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds a file sink; replaces a previously configured one.
    void set_output_file(const std::string& filename);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    std::shared_ptr<spdlog::logger> logger_;
    std::string output_file_;
};

// Parses trace|debug|info|warn|warning|error|critical (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

// Convenience macros, fmt-style format strings
#define LOG_TRACE(...)    fedrelay::Logger::getInstance().get().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    fedrelay::Logger::getInstance().get().debug(__VA_ARGS__)
#define LOG_INFO(...)     fedrelay::Logger::getInstance().get().info(__VA_ARGS__)
#define LOG_WARN(...)     fedrelay::Logger::getInstance().get().warn(__VA_ARGS__)
#define LOG_ERROR(...)    fedrelay::Logger::getInstance().get().error(__VA_ARGS__)
#define LOG_CRITICAL(...) fedrelay::Logger::getInstance().get().critical(__VA_ARGS__)

} // namespace fedrelay
