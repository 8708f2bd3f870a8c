//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// logging/logger.cpp
//
// Logger implementation using spdlog
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <vector>

namespace duckes {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::string Logger::log_file_;
bool Logger::initialized_ = false;

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, MAX_FILE_SIZE, MAX_FILES);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("duckes", sinks.begin(), sinks.end());
    logger_->set_level(ToSpdlogLevel(log_level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);

    log_file_ = log_file;
    initialized_ = true;
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    logger_.reset();
    log_file_.clear();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::SetLevel(LogLevel level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::SetLevel(const std::string& level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
        default:              return spdlog::level::info;
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info")  return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "fatal" || lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;

    return spdlog::level::info;
}

} // namespace duckes
