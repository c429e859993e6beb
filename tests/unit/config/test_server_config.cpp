//===----------------------------------------------------------------------===//
//                         MCPD Server - Unit Tests
//
// tests/unit/config/test_server_config.cpp
//
// Unit tests for ServerConfig
//===----------------------------------------------------------------------===//

#include "config/server_config.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cstdlib>

using namespace mcpd_server;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static std::string WriteTempFile(const std::string& content, const std::string& suffix) {
    std::string path = "/tmp/mcpd_test_config" + suffix;
    std::ofstream f(path);
    f << content;
    f.close();
    return path;
}

static void CleanupFile(const std::string& path) {
    std::remove(path.c_str());
}

static ServerConfig Parse(std::vector<const char*> args, bool* show_version_out = nullptr) {
    args.insert(args.begin(), "mcpd");
    bool show_version = false;
    auto config = ParseCommandLine(static_cast<int>(args.size()),
                                   const_cast<char**>(args.data()), show_version);
    if (show_version_out) {
        *show_version_out = show_version;
    }
    return config;
}

//===----------------------------------------------------------------------===//
// Defaults and Validation
//===----------------------------------------------------------------------===//

void TestDefaultValues() {
    std::cout << "  Testing default values..." << std::endl;

    ServerConfig config;
    assert(config.host == "0.0.0.0");
    assert(config.port == 9000);
    assert(config.http_port == 0);
    assert(config.log_level == "info");
    assert(config.log_file.empty());
    assert(config.max_connections == 100);
    assert(config.max_message_bytes == DEFAULT_MAX_MESSAGE_BYTES);
    assert(config.call_timeout_ms == 30000);
    assert(config.query_latency_ms == 50);
    assert(config.stream_batch_size == 5);
    assert(config.stream_batch_delay_ms == 20);

    std::cout << "    PASSED" << std::endl;
}

void TestValidation() {
    std::cout << "  Testing validation..." << std::endl;

    std::string error;
    ServerConfig config;
    assert(config.Validate(error));

    config.port = 0;
    assert(!config.Validate(error));
    assert(error == "Invalid port number");

    config = ServerConfig();
    config.max_connections = 0;
    assert(!config.Validate(error));

    config = ServerConfig();
    config.call_timeout_ms = 0;
    assert(!config.Validate(error));
    assert(error == "Call timeout must be greater than 0");

    config = ServerConfig();
    config.stream_batch_size = 0;
    assert(!config.Validate(error));

    config = ServerConfig();
    config.max_message_bytes = 0;
    assert(!config.Validate(error));

    config = ServerConfig();
    config.log_level = "verbose";
    assert(!config.Validate(error));
    assert(error == "Invalid log level: verbose");

    config.log_level = "WARNING";
    assert(config.Validate(error));

    std::cout << "    PASSED" << std::endl;
}

void TestAutoThreadCounts() {
    std::cout << "  Testing auto thread counts..." << std::endl;

    ServerConfig config;
    assert(config.GetIoThreadCount() >= 1);
    assert(config.GetExecutorThreadCount() >= 2);

    config.io_threads = 3;
    config.executor_threads = 7;
    assert(config.GetIoThreadCount() == 3);
    assert(config.GetExecutorThreadCount() == 7);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Environment
//===----------------------------------------------------------------------===//

void TestPortEnvironment() {
    std::cout << "  Testing PORT environment variable..." << std::endl;

    setenv("PORT", "7070", 1);
    assert(Parse({}).port == 7070);

    // Flags win over the environment
    assert(Parse({"--port", "7171"}).port == 7171);

    // Invalid values are ignored
    setenv("PORT", "seventy", 1);
    assert(Parse({}).port == DEFAULT_PORT);

    unsetenv("PORT");
    assert(Parse({}).port == DEFAULT_PORT);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Config Files
//===----------------------------------------------------------------------===//

void TestLoadFromIni() {
    std::cout << "  Testing LoadFromIni..." << std::endl;

    std::string path = WriteTempFile(
        "# mcpd\n"
        "host = 127.0.0.1\n"
        "port = 9100\n"
        "log_level = \"debug\"\n"
        "; limits\n"
        "max_connections = 25\n"
        "call_timeout_ms = 1500\n"
        "stream_batch_size = 3\n",
        ".conf");

    ServerConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.host == "127.0.0.1");
    assert(config.port == 9100);
    assert(config.log_level == "debug");
    assert(config.max_connections == 25);
    assert(config.call_timeout_ms == 1500);
    assert(config.stream_batch_size == 3);
    assert(config.query_latency_ms == 50);  // untouched

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromIniErrors() {
    std::cout << "  Testing LoadFromIni errors..." << std::endl;

    std::string error;
    ServerConfig config;
    assert(!config.LoadFromFile("/tmp/mcpd_no_such_file.conf", error));
    assert(error.find("Cannot open config file") != std::string::npos);

    std::string path = WriteTempFile("port = 70000\n", ".conf");
    assert(!config.LoadFromFile(path, error));
    assert(error == "Invalid value for 'port': 70000");
    CleanupFile(path);

    path = WriteTempFile("just a line\n", ".conf");
    assert(!config.LoadFromFile(path, error));
    assert(error.find("missing '='") != std::string::npos);
    CleanupFile(path);

    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromYaml() {
    std::cout << "  Testing LoadFromYaml..." << std::endl;

    std::string path = WriteTempFile(
        "server:\n"
        "  host: 127.0.0.1\n"
        "  port: 9200\n"
        "  http_port: 9201\n"
        "logging:\n"
        "  level: warn\n"
        "  file: /tmp/mcpd.log\n"
        "threads:\n"
        "  io: 2\n"
        "  executor: 16\n"
        "limits:\n"
        "  max_connections: 40\n"
        "  max_message_bytes: 65536\n"
        "  call_timeout_ms: 2500\n"
        "query:\n"
        "  latency_ms: 5\n"
        "  stream_batch_size: 4\n"
        "  stream_batch_delay_ms: 0\n",
        ".yaml");

    ServerConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.host == "127.0.0.1");
    assert(config.port == 9200);
    assert(config.http_port == 9201);
    assert(config.log_level == "warn");
    assert(config.log_file == "/tmp/mcpd.log");
    assert(config.io_threads == 2);
    assert(config.executor_threads == 16);
    assert(config.max_connections == 40);
    assert(config.max_message_bytes == 65536);
    assert(config.call_timeout_ms == 2500);
    assert(config.query_latency_ms == 5);
    assert(config.stream_batch_size == 4);
    assert(config.stream_batch_delay_ms == 0);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromYamlPartialAndInvalid() {
    std::cout << "  Testing partial and invalid YAML..." << std::endl;

    std::string path = WriteTempFile("server:\n  port: 9300\n", ".yml");
    ServerConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.port == 9300);
    assert(config.host == "0.0.0.0");
    CleanupFile(path);

    path = WriteTempFile("server:\n  port: lots\n", ".yaml");
    assert(!config.LoadFromFile(path, error));
    assert(error == "Invalid value for 'server.port': lots");
    CleanupFile(path);

    path = WriteTempFile("- just\n- a list\n", ".yaml");
    assert(!config.LoadFromFile(path, error));
    CleanupFile(path);

    assert(!config.LoadFromFile("/tmp/mcpd_no_such_file.yaml", error));
    assert(error.find("Cannot open config file") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Command Line
//===----------------------------------------------------------------------===//

void TestParseCommandLine() {
    std::cout << "  Testing ParseCommandLine..." << std::endl;

    unsetenv("PORT");
    bool show_version = true;
    auto config = Parse({
        "-h", "127.0.0.1",
        "-p", "9876",
        "--http-port", "8080",
        "--log-level", "debug",
        "--io-threads", "4",
        "--executor-threads", "8",
        "--max-connections", "200",
        "--max-message-bytes", "4096",
        "--call-timeout", "1000",
        "--query-latency", "10",
        "--batch-size", "2",
        "--batch-delay", "0"
    }, &show_version);

    assert(!show_version);
    assert(config.host == "127.0.0.1");
    assert(config.port == 9876);
    assert(config.http_port == 8080);
    assert(config.log_level == "debug");
    assert(config.io_threads == 4);
    assert(config.executor_threads == 8);
    assert(config.max_connections == 200);
    assert(config.max_message_bytes == 4096);
    assert(config.call_timeout_ms == 1000);
    assert(config.query_latency_ms == 10);
    assert(config.stream_batch_size == 2);
    assert(config.stream_batch_delay_ms == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestParseCommandLineVersion() {
    std::cout << "  Testing ParseCommandLine --version..." << std::endl;

    bool show_version = false;
    Parse({"--version"}, &show_version);
    assert(show_version);

    std::cout << "    PASSED" << std::endl;
}

void TestFlagsOverrideConfigFile() {
    std::cout << "  Testing flags override the config file..." << std::endl;

    unsetenv("PORT");
    std::string path = WriteTempFile("server:\n  port: 9400\n  host: 10.0.0.1\n", ".yaml");

    auto config = Parse({"--port", "9500", "-c", path.c_str()});
    assert(config.port == 9500);
    assert(config.host == "10.0.0.1");
    assert(config.config_file == path);

    // Config file wins over the environment
    setenv("PORT", "7070", 1);
    assert(Parse({"--config", path.c_str()}).port == 9400);
    unsetenv("PORT");

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ServerConfig Unit Tests ===" << std::endl;

    std::cout << "\n1. Defaults and Validation:" << std::endl;
    TestDefaultValues();
    TestValidation();
    TestAutoThreadCounts();

    std::cout << "\n2. Environment:" << std::endl;
    TestPortEnvironment();

    std::cout << "\n3. Config Files:" << std::endl;
    TestLoadFromIni();
    TestLoadFromIniErrors();
    TestLoadFromYaml();
    TestLoadFromYamlPartialAndInvalid();

    std::cout << "\n4. Command Line:" << std::endl;
    TestParseCommandLine();
    TestParseCommandLineVersion();
    TestFlagsOverrideConfigFile();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
