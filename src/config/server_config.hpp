//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// config/server_config.hpp
//
// Server configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace mcpd_server {

constexpr uint16_t DEFAULT_PORT = 9000;

struct ServerConfig {
    // Network
    std::string host = "0.0.0.0";
    uint16_t port = DEFAULT_PORT;
    uint16_t http_port = 0;  // 0 = disabled, for health/metrics

    // Logging
    std::string log_file;
    std::string log_level = "info";

    // Process
    std::string config_file;

    // Threading
    uint32_t io_threads = 0;  // 0 = auto
    uint32_t executor_threads = 0;  // 0 = auto

    // Limits
    uint32_t max_connections = 100;
    uint64_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
    uint32_t call_timeout_ms = DEFAULT_CALL_TIMEOUT_MS;

    // Query source
    uint32_t query_latency_ms = DEFAULT_QUERY_LATENCY_MS;
    uint32_t stream_batch_size = DEFAULT_STREAM_BATCH_SIZE;
    uint32_t stream_batch_delay_ms = DEFAULT_STREAM_BATCH_DELAY_MS;

    uint32_t GetIoThreadCount() const {
        if (io_threads == 0) {
            return std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        return io_threads;
    }

    // Tool calls mostly wait on the query source, so the auto size is
    // twice the core count
    uint32_t GetExecutorThreadCount() const {
        if (executor_threads == 0) {
            return std::max(2u, std::thread::hardware_concurrency() * 2);
        }
        return executor_threads;
    }

    // PORT from the environment replaces the built-in default
    void ApplyEnvironment() {
        const char* env_port = std::getenv("PORT");
        if (!env_port || *env_port == '\0') {
            return;
        }
        char* end = nullptr;
        long parsed = std::strtol(env_port, &end, 10);
        if (*end == '\0' && parsed > 0 && parsed <= std::numeric_limits<uint16_t>::max()) {
            port = static_cast<uint16_t>(parsed);
        } else {
            std::cerr << "Ignoring invalid PORT environment value: " << env_port << std::endl;
        }
    }

    bool Validate(std::string& error) const {
        if (port == 0) {
            error = "Invalid port number";
            return false;
        }
        if (max_connections == 0) {
            error = "Max connections must be greater than 0";
            return false;
        }
        if (max_message_bytes == 0) {
            error = "Max message size must be greater than 0";
            return false;
        }
        if (call_timeout_ms == 0) {
            error = "Call timeout must be greater than 0";
            return false;
        }
        if (stream_batch_size == 0) {
            error = "Stream batch size must be greater than 0";
            return false;
        }
        spdlog::level::level_enum level;
        if (!mcpd::Logger::ParseLevel(log_level, level)) {
            error = "Invalid log level: " + log_level;
            return false;
        }
        return true;
    }

    // Load from config file (format chosen by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        }
        return LoadFromIni(path, error);
    }

    // Load from key = value file (legacy format)
    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        if (cfg.Has("host")) host = cfg.GetString("host");
        if (cfg.Has("log_file")) log_file = cfg.GetString("log_file");
        if (cfg.Has("log_level")) log_level = cfg.GetString("log_level");

        bool ok = ReadUint(cfg, "port", port)
            && ReadUint(cfg, "http_port", http_port)
            && ReadUint(cfg, "io_threads", io_threads)
            && ReadUint(cfg, "executor_threads", executor_threads)
            && ReadUint(cfg, "max_connections", max_connections)
            && ReadUint(cfg, "max_message_bytes", max_message_bytes)
            && ReadUint(cfg, "call_timeout_ms", call_timeout_ms)
            && ReadUint(cfg, "query_latency_ms", query_latency_ms)
            && ReadUint(cfg, "stream_batch_size", stream_batch_size)
            && ReadUint(cfg, "stream_batch_delay_ms", stream_batch_delay_ms);

        if (!ok) {
            error = cfg.GetError();
        }
        return ok;
    }

    // Load from YAML config file
    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        bool ok =
            // Server section
            cfg.Get("server.host", host)
            && cfg.Get("server.port", port)
            && cfg.Get("server.http_port", http_port)
            // Logging section
            && cfg.Get("logging.file", log_file)
            && cfg.Get("logging.level", log_level)
            // Threads section
            && cfg.Get("threads.io", io_threads)
            && cfg.Get("threads.executor", executor_threads)
            // Limits section
            && cfg.Get("limits.max_connections", max_connections)
            && cfg.Get("limits.max_message_bytes", max_message_bytes)
            && cfg.Get("limits.call_timeout_ms", call_timeout_ms)
            // Query section
            && cfg.Get("query.latency_ms", query_latency_ms)
            && cfg.Get("query.stream_batch_size", stream_batch_size)
            && cfg.Get("query.stream_batch_delay_ms", stream_batch_delay_ms);

        if (!ok) {
            error = cfg.GetError();
        }
        return ok;
    }

private:
    template<typename T>
    static bool ReadUint(ConfigFile& cfg, const std::string& key, T& field) {
        uint64_t value = field;
        if (!cfg.GetUint(key, value, std::numeric_limits<T>::max())) {
            return false;
        }
        field = static_cast<T>(value);
        return true;
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>       Config file path (.yaml/.yml or key=value)\n"
              << "  -h, --host <host>         Host to bind (default: 0.0.0.0)\n"
              << "  -p, --port <port>         Port to bind (default: $PORT or 9000)\n"
              << "  --http-port <port>        HTTP port for health/metrics (default: disabled)\n"
              << "  --log-file <path>         Log file path\n"
              << "  --log-level <level>       Log level (trace, debug, info, warn, error)\n"
              << "  --io-threads <n>          IO thread count (default: auto)\n"
              << "  --executor-threads <n>    Executor thread count (default: auto)\n"
              << "  --max-connections <n>     Max connections (default: 100)\n"
              << "  --max-message-bytes <n>   Max request line size (default: 1048576)\n"
              << "  --call-timeout <ms>       Tool call timeout (default: 30000)\n"
              << "  --query-latency <ms>      Simulated query latency (default: 50)\n"
              << "  --batch-size <n>          Default streaming batch size (default: 5)\n"
              << "  --batch-delay <ms>        Delay between streamed batches (default: 20)\n"
              << "  --version                 Show version info\n"
              << "  --help                    Show this help\n";
}

namespace detail {

template<typename T>
T ParseFlagValue(const std::string& flag, const char* text) {
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(text, &end, 10);
    if (*text == '\0' || *text == '-' || *end != '\0' || errno == ERANGE ||
        parsed > std::numeric_limits<T>::max()) {
        std::cerr << "Invalid value for " << flag << ": " << text << std::endl;
        std::exit(1);
    }
    return static_cast<T>(parsed);
}

} // namespace detail

// Precedence: built-in defaults < PORT env < config file < flags
inline ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    ServerConfig config;
    config.ApplyEnvironment();
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && has_value) {
            ++i;  // Already processed
        } else if ((arg == "-h" || arg == "--host") && has_value) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && has_value) {
            config.port = detail::ParseFlagValue<uint16_t>(arg, argv[++i]);
        } else if (arg == "--http-port" && has_value) {
            config.http_port = detail::ParseFlagValue<uint16_t>(arg, argv[++i]);
        } else if (arg == "--log-file" && has_value) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            config.log_level = argv[++i];
        } else if (arg == "--io-threads" && has_value) {
            config.io_threads = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else if (arg == "--executor-threads" && has_value) {
            config.executor_threads = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else if (arg == "--max-connections" && has_value) {
            config.max_connections = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else if (arg == "--max-message-bytes" && has_value) {
            config.max_message_bytes = detail::ParseFlagValue<uint64_t>(arg, argv[++i]);
        } else if (arg == "--call-timeout" && has_value) {
            config.call_timeout_ms = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else if (arg == "--query-latency" && has_value) {
            config.query_latency_ms = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else if (arg == "--batch-size" && has_value) {
            config.stream_batch_size = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else if (arg == "--batch-delay" && has_value) {
            config.stream_batch_delay_ms = detail::ParseFlagValue<uint32_t>(arg, argv[++i]);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            std::exit(1);
        }
    }

    return config;
}

} // namespace mcpd_server
