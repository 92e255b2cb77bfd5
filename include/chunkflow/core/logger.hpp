#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace chunkflow::core {

enum class LogLevel {
    Trace = SPDLOG_LEVEL_TRACE,
    Debug = SPDLOG_LEVEL_DEBUG,
    Info = SPDLOG_LEVEL_INFO,
    Warn = SPDLOG_LEVEL_WARN,
    Error = SPDLOG_LEVEL_ERROR,
    Critical = SPDLOG_LEVEL_CRITICAL,
    Off = SPDLOG_LEVEL_OFF
};

class Logger {
public:
    static constexpr size_t MAX_LOG_FILE_BYTES = 5 * 1024 * 1024;
    static constexpr size_t MAX_LOG_FILES = 3;
    
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();
    
    static std::shared_ptr<spdlog::logger> get() { return logger_; }
    
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::Info);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace chunkflow::core

// Before initialize() these go to spdlog's default console logger.
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
