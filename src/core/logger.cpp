#include "chunkflow/core/logger.hpp"
#include "chunkflow/core/utils.hpp"

namespace chunkflow::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

// An empty log_file logs to the console only.
void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto spd_level = static_cast<spdlog::level::level_enum>(level);
    
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spd_level);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, MAX_LOG_FILE_BYTES, MAX_LOG_FILES);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    
    logger_ = std::make_shared<spdlog::logger>("chunkflow", sinks.begin(), sinks.end());
    logger_->set_level(spd_level);
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    
    LOG_DEBUG("Logger initialized at level {}", spdlog::level::to_string_view(spd_level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();
        
        // LOG_* macros keep working after shutdown, console only
        spdlog::set_default_logger(spdlog::stdout_color_mt("console"));
    }
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    
    return fallback;
}

} // namespace chunkflow::core
