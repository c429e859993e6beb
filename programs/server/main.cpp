//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// main.cpp
//
// Server main entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/server_config.hpp"
#include "executor/executor_pool.hpp"
#include "http/http_server.hpp"
#include "metrics/metrics.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "query/mock_query_source.hpp"
#include "session/session_manager.hpp"
#include "tools/tool_executor.hpp"
#include "tools/tool_registry.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <iostream>
#include <pthread.h>

using namespace mcpd_server;

static ServerConfig g_config;

//===----------------------------------------------------------------------===//
// Version Info
//===----------------------------------------------------------------------===//
void PrintVersion() {
    std::cout << "MCPD Server " << MCPD_VERSION << "\n"
              << "Protocol version: " << MCPD_PROTOCOL_VERSION << "\n"
              << "Build type: " << MCPD_BUILD_TYPE << "\n";
}

//===----------------------------------------------------------------------===//
// Reload (SIGHUP)
//===----------------------------------------------------------------------===//
void ReloadConfig() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "No config file specified, cannot reload");
        return;
    }

    LOG_INFO("main", "Reloading configuration from: " + g_config.config_file);

    ServerConfig new_config;
    std::string error;
    if (!new_config.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Failed to reload config: " + error);
        return;
    }

    // Only the log level is applied at runtime
    if (new_config.log_level != g_config.log_level) {
        if (!mcpd::Logger::SetLevel(new_config.log_level)) {
            LOG_ERROR("main", "Ignoring invalid log level: " + new_config.log_level);
        } else {
            g_config.log_level = new_config.log_level;
            LOG_INFO("main", "Log level changed to: " + new_config.log_level);
        }
    }

    LOG_INFO("main", "Configuration reloaded (other settings require restart)");
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        bool show_version;
        g_config = ParseCommandLine(argc, argv, show_version);

        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!g_config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        mcpd::Logger::Initialize(g_config.log_file, g_config.log_level);

        // Block SIGINT/SIGTERM/SIGHUP before any thread starts so they are
        // only consumed by sigwait() below
        sigset_t signal_mask;
        sigemptyset(&signal_mask);
        sigaddset(&signal_mask, SIGINT);
        sigaddset(&signal_mask, SIGTERM);
        sigaddset(&signal_mask, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &signal_mask, nullptr);

        std::signal(SIGPIPE, SIG_IGN);

        LOG_INFO("main", "Starting MCPD Server " + std::string(MCPD_VERSION));
        LOG_INFO("main", "Configuration:");
        LOG_INFO("main", "  Host: " + g_config.host);
        LOG_INFO("main", "  Port: " + std::to_string(g_config.port));
        LOG_INFO("main", "  IO Threads: " + std::to_string(g_config.GetIoThreadCount()));
        LOG_INFO("main", "  Executor Threads: " + std::to_string(g_config.GetExecutorThreadCount()));
        LOG_INFO("main", "  Max Connections: " + std::to_string(g_config.max_connections));
        LOG_INFO("main", "  Call Timeout: " + std::to_string(g_config.call_timeout_ms) + "ms");
        if (g_config.http_port > 0) {
            LOG_INFO("main", "  HTTP Port: " + std::to_string(g_config.http_port));
        }

        // Query backend
        MockQuerySource::Options source_options;
        source_options.latency = std::chrono::milliseconds(g_config.query_latency_ms);
        source_options.batch_delay = std::chrono::milliseconds(g_config.stream_batch_delay_ms);
        auto query_source = std::make_shared<MockQuerySource>(source_options);

        auto metrics = std::make_shared<Metrics>();

        auto executor_pool = std::make_shared<ExecutorPool>(g_config.GetExecutorThreadCount());
        executor_pool->Start();

        ToolExecutor::Options executor_options;
        executor_options.default_batch_size = g_config.stream_batch_size;
        auto tool_executor = std::make_shared<ToolExecutor>(
            BuildDefaultRegistry(), query_source, metrics, executor_pool, executor_options);

        ProtocolHandler::Config handler_config;
        handler_config.call_timeout = std::chrono::milliseconds(g_config.call_timeout_ms);
        auto handler = std::make_shared<ProtocolHandler>(
            tool_executor, executor_pool, metrics, handler_config);

        auto session_manager = std::make_shared<SessionManager>(g_config.max_connections);

        auto server = std::make_shared<TcpServer>(g_config, session_manager, handler);
        server->Start();

        std::unique_ptr<HttpServer> http_server;
        if (g_config.http_port > 0) {
            http_server = std::make_unique<HttpServer>(
                g_config.host, g_config.http_port, metrics,
                [session_manager]() { return session_manager->GetActiveSessionCount(); });
            http_server->Start();
        }

        LOG_INFO("main", "MCPD Server is ready to accept connections");

        // Main loop: wait for signals synchronously
        int sig;
        while (sigwait(&signal_mask, &sig) == 0) {
            if (sig == SIGHUP) {
                LOG_INFO("main", "Reload signal received");
                ReloadConfig();
            } else {
                LOG_INFO("main", "Shutdown signal received");
                break;
            }
        }

        LOG_INFO("main", "Shutting down...");

        if (http_server) {
            http_server->Stop();
        }

        // Stop reading first; running calls finish, queued ones are dropped
        server->Stop();
        session_manager->CloseAll("server shutdown");
        executor_pool->Stop();

        auto snapshot = metrics->Snapshot();
        LOG_INFO("main", "Served " + std::to_string(snapshot.completed) + " tool calls in " +
                 std::to_string(snapshot.uptime_seconds) + "s");
        LOG_INFO("main", "MCPD Server stopped");

        mcpd::Logger::Shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
