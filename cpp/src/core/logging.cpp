#include "fedrelay/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace fedrelay {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    logger_ = std::make_shared<spdlog::logger>("fedrelay", console_sink);
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger_->flush_on(spdlog::level::warn);
}

Logger::~Logger() {
    if (logger_) {
        logger_->flush();
    }
}

void Logger::set_level(LogLevel level) {
    logger_->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    switch (logger_->level()) {
        case spdlog::level::trace: return LogLevel::TRACE;
        case spdlog::level::debug: return LogLevel::DEBUG;
        case spdlog::level::warn: return LogLevel::WARN;
        case spdlog::level::err: return LogLevel::ERROR;
        case spdlog::level::critical: return LogLevel::CRITICAL;
        default: return LogLevel::INFO;
    }
}

void Logger::set_output_file(const std::string& filename) {
    if (filename.empty() || filename == output_file_) {
        return;
    }

    auto& sinks = logger_->sinks();
    // The console sink is always first; anything after it is the file sink.
    if (sinks.size() > 1) {
        sinks.erase(sinks.begin() + 1, sinks.end());
    }

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);
    output_file_ = filename;
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "trace") out = LogLevel::TRACE;
    else if (val == "debug") out = LogLevel::DEBUG;
    else if (val == "info") out = LogLevel::INFO;
    else if (val == "warn" || val == "warning") out = LogLevel::WARN;
    else if (val == "error") out = LogLevel::ERROR;
    else if (val == "critical") out = LogLevel::CRITICAL;
    else return false;
    return true;
}

} // namespace fedrelay
