//===----------------------------------------------------------------------===//
//                         MCPD Server - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for the spdlog-backed Logger
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>

using namespace mcpd;

static std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void TestLevelConversion() {
    std::cout << "  Testing level conversion..." << std::endl;

    spdlog::level::level_enum level = spdlog::level::info;
    assert(Logger::ParseLevel("trace", level) && level == spdlog::level::trace);
    assert(Logger::ParseLevel("Error", level) && level == spdlog::level::err);
    assert(Logger::ParseLevel("FATAL", level) && level == spdlog::level::critical);

    // Unknown names are reported and leave the output alone
    assert(!Logger::ParseLevel("verbose", level));
    assert(level == spdlog::level::critical);
    assert(!Logger::ParseLevel("", level));

    assert(Logger::ToSpdlogLevel("debug") == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel("DEBUG") == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel("Warning") == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel("critical") == spdlog::level::critical);
    assert(Logger::ToSpdlogLevel("off") == spdlog::level::off);

    // Unknown names fall back to info
    assert(Logger::ToSpdlogLevel("verbose") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("") == spdlog::level::info);

    std::cout << "    PASSED" << std::endl;
}

void TestAutoInitialize() {
    std::cout << "  Testing Get() auto-initializes at info..." << std::endl;

    Logger::Shutdown();
    assert(!Logger::IsInitialized());

    auto& logger = Logger::Get();
    assert(logger != nullptr);
    assert(Logger::IsInitialized());
    assert(logger->level() == spdlog::level::info);
    assert(Logger::GetLevel() == "info");

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestInitializeOnce() {
    std::cout << "  Testing second Initialize is ignored..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "debug");
    Logger::Initialize("", "error");
    assert(Logger::Get()->level() == spdlog::level::debug);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestSetLevel() {
    std::cout << "  Testing SetLevel at runtime..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "info");

    assert(Logger::SetLevel("warn"));
    assert(Logger::Get()->level() == spdlog::level::warn);
    assert(!Logger::Get()->should_log(spdlog::level::info));

    // Rejected names keep the current level
    assert(!Logger::SetLevel("loud"));
    assert(Logger::GetLevel() == "warning");

    assert(Logger::SetLevel("trace"));
    assert(Logger::GetLevel() == "trace");
    assert(Logger::Get()->should_log(spdlog::level::debug));

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestFileOutputAndFiltering() {
    std::cout << "  Testing file output, component tags and filtering..." << std::endl;

    std::string path = "/tmp/mcpd_test_logger.log";
    std::filesystem::remove(path);

    Logger::Shutdown();
    Logger::Initialize(path, "info");

    LOG_DEBUG("session", "hidden debug line");
    LOG_INFO("tool_executor", "Invoking tool list_tables");
    LOG_WARN("network", "Connection reset");
    DLOG_INFO("metrics", "{} calls in {}ms", 3, 42);

    Logger::Flush();
    Logger::Shutdown();

    assert(std::filesystem::exists(path));
    std::string content = ReadFile(path);
    assert(content.find("[tool_executor] Invoking tool list_tables") != std::string::npos);
    assert(content.find("[network] Connection reset") != std::string::npos);
    assert(content.find("[metrics] 3 calls in 42ms") != std::string::npos);
    assert(content.find("hidden debug line") == std::string::npos);
    assert(content.find("[warning]") != std::string::npos);

    std::filesystem::remove(path);
    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    TestLevelConversion();
    TestAutoInitialize();
    TestInitializeOnce();
    TestSetLevel();
    TestFileOutputAndFiltering();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
