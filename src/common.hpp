//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// common.hpp
//
// Common definitions and includes for MCPD Server
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <unordered_map>

namespace mcpd_server {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Forward declarations
class TcpServer;
class Session;
class SessionManager;
class ExecutorPool;
class ToolRegistry;
class ToolExecutor;
class QuerySource;
class Metrics;
struct ServerConfig;

// Shared pointer types
using SessionPtr = std::shared_ptr<Session>;

// Writes one serialized frame to the peer
using SendCallback = std::function<void(std::string)>;

// Constants
constexpr size_t DEFAULT_MAX_CONNECTIONS = 10000;
constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 1024 * 1024;  // 1MB per line
constexpr uint32_t DEFAULT_CALL_TIMEOUT_MS = 30000;
constexpr uint32_t DEFAULT_QUERY_LATENCY_MS = 50;
constexpr uint32_t DEFAULT_STREAM_BATCH_SIZE = 5;
constexpr uint32_t DEFAULT_STREAM_BATCH_DELAY_MS = 20;
constexpr size_t DEFAULT_STREAM_CHANNEL_CAPACITY = 10;

inline int64_t ElapsedMillis(TimePoint start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

} // namespace mcpd_server
