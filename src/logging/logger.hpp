//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// logging/logger.hpp
//
// Logging utilities based on spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace duckes {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

class Logger {
public:
    // Rotating file sink limits
    static constexpr size_t MAX_FILE_SIZE = 50 * 1024 * 1024;
    static constexpr size_t MAX_FILES = 3;

    // Initialize logging system (console always, rotating file when log_file is set)
    static void Initialize(const std::string& log_file = "",
                          const std::string& log_level = "info");

    // Shutdown logging system
    static void Shutdown();

    // Get the main logger instance (auto-initializes with defaults)
    static std::shared_ptr<spdlog::logger>& Get();

    static bool IsInitialized() { return initialized_; }

    // Path of the rotating file sink, empty when logging to console only
    static const std::string& GetLogFile() { return log_file_; }

    // Set log level
    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);

    // Flush all logs
    static void Flush();

    // Convert between log levels
    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::string log_file_;
    static bool initialized_;
};

} // namespace duckes

// LOG_INFO("component", "message " + std::to_string(x))
#define LOG_TRACE(component, message) \
    do { \
        if (duckes::Logger::Get()->should_log(spdlog::level::trace)) \
            duckes::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (duckes::Logger::Get()->should_log(spdlog::level::debug)) \
            duckes::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (duckes::Logger::Get()->should_log(spdlog::level::info)) \
            duckes::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (duckes::Logger::Get()->should_log(spdlog::level::warn)) \
            duckes::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (duckes::Logger::Get()->should_log(spdlog::level::err)) \
            duckes::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

#define LOG_FATAL(component, message) \
    do { \
        if (duckes::Logger::Get()->should_log(spdlog::level::critical)) \
            duckes::Logger::Get()->critical("[{}] {}", component, message); \
    } while(0)

// fmt style: DLOG_INFO("loader", "Imported {} in {}", table, elapsed)
#define DLOG_TRACE(component, fmt, ...) \
    duckes::Logger::Get()->trace("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_DEBUG(component, fmt, ...) \
    duckes::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_INFO(component, fmt, ...) \
    duckes::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_WARN(component, fmt, ...) \
    duckes::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_ERROR(component, fmt, ...) \
    duckes::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_FATAL(component, fmt, ...) \
    duckes::Logger::Get()->critical("[{}] " fmt, component, ##__VA_ARGS__)
