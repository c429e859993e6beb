//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// logging/logger.cpp
//
// Logger implementation using spdlog
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <cctype>
#include <vector>

namespace mcpd {

namespace {

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

const LevelName LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"fatal", spdlog::level::critical},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
};

// Thread id helps tell IO threads from executor workers
constexpr const char* CONSOLE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v";

std::vector<spdlog::sink_ptr> MakeSinks(const std::string& log_file,
                                        size_t max_file_size, size_t max_files) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(std::move(console));

    if (!log_file.empty()) {
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_file_size, max_files);
        rotating->set_pattern(FILE_PATTERN);
        sinks.push_back(std::move(rotating));
    }
    return sinks;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;

void Logger::Initialize(const std::string& log_file, const std::string& log_level,
                        size_t max_file_size, size_t max_files) {
    if (initialized_) {
        return;
    }

    auto sinks = MakeSinks(log_file, max_file_size, max_files);
    logger_ = std::make_shared<spdlog::logger>("mcpd", sinks.begin(), sinks.end());
    logger_->set_level(ToSpdlogLevel(log_level));
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);

    initialized_ = true;
}

void Logger::Shutdown() {
    Flush();
    spdlog::shutdown();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

bool Logger::SetLevel(const std::string& level) {
    spdlog::level::level_enum parsed;
    if (!ParseLevel(level, parsed)) {
        return false;
    }
    Get()->set_level(parsed);
    return true;
}

std::string Logger::GetLevel() {
    auto name = spdlog::level::to_string_view(Get()->level());
    return std::string(name.data(), name.size());
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

bool Logger::ParseLevel(const std::string& name, spdlog::level::level_enum& level) {
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }

    for (const auto& entry : LEVEL_NAMES) {
        if (lower == entry.name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    spdlog::level::level_enum parsed;
    if (!ParseLevel(level, parsed)) {
        return spdlog::level::info;
    }
    return parsed;
}

} // namespace mcpd
