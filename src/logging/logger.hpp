//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// logging/logger.hpp
//
// Process-wide logging facade over spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace mcpd {

class Logger {
public:
    static constexpr size_t DEFAULT_MAX_FILE_SIZE = 50 * 1024 * 1024;
    static constexpr size_t DEFAULT_MAX_FILES = 3;

    // Initialize logging (console always, rotating file when log_file is set)
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "info",
                           size_t max_file_size = DEFAULT_MAX_FILE_SIZE,
                           size_t max_files = DEFAULT_MAX_FILES);

    static void Shutdown();

    // Main logger, auto-initialized with console defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static bool IsInitialized() { return initialized_; }

    // Unknown names leave the level unchanged and return false
    static bool SetLevel(const std::string& level);
    static std::string GetLevel();

    static void Flush();

    // Case-insensitive; accepts trace, debug, info, warn/warning,
    // error, fatal/critical and off
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& level);

    // ParseLevel with info as the fallback
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace mcpd

// Usage: LOG_INFO("component", "message " + std::to_string(x))

#define LOG_TRACE(component, message) \
    do { \
        if (mcpd::Logger::Get()->should_log(spdlog::level::trace)) \
            mcpd::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (mcpd::Logger::Get()->should_log(spdlog::level::debug)) \
            mcpd::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (mcpd::Logger::Get()->should_log(spdlog::level::info)) \
            mcpd::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (mcpd::Logger::Get()->should_log(spdlog::level::warn)) \
            mcpd::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (mcpd::Logger::Get()->should_log(spdlog::level::err)) \
            mcpd::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

#define LOG_FATAL(component, message) \
    do { \
        if (mcpd::Logger::Get()->should_log(spdlog::level::critical)) \
            mcpd::Logger::Get()->critical("[{}] {}", component, message); \
    } while(0)

// fmt-style variants: DLOG_INFO("component", "{} rows in {}ms", rows, ms)
#define DLOG_TRACE(component, fmt, ...) \
    mcpd::Logger::Get()->trace("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_DEBUG(component, fmt, ...) \
    mcpd::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_INFO(component, fmt, ...) \
    mcpd::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_WARN(component, fmt, ...) \
    mcpd::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_ERROR(component, fmt, ...) \
    mcpd::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
