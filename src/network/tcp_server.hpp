//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// network/tcp_server.hpp
//
// TCP accept loop
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include "network/tcp_connection.hpp"
#include <asio.hpp>
#include <set>

namespace mcpd_server {

class ProtocolHandler;

class TcpServer {
public:
    TcpServer(const ServerConfig& config,
              std::shared_ptr<SessionManager> session_manager,
              std::shared_ptr<ProtocolHandler> handler);
    ~TcpServer();

    // Non-copyable
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Bind, listen and start accepting. Throws asio::system_error if the
    // address cannot be bound.
    void Start();

    void Stop();

    bool IsRunning() const { return running_; }

    // Bound port; differs from the configured one when that was 0
    uint16_t GetPort() const { return bound_port_; }

    std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }

    // Connection management
    void AddConnection(const TcpConnection::Ptr& conn);
    void RemoveConnection(const TcpConnection::Ptr& conn);
    size_t GetConnectionCount() const;

    // Live connections per IO thread, including the one waiting in accept
    std::vector<size_t> GetIoLoad() const { return io_pool_.GetLoad(); }

    const ServerConfig& GetConfig() const { return config_; }

    // Statistics
    uint64_t GetTotalConnections() const { return total_connections_; }
    uint64_t GetTotalBytesReceived() const { return total_bytes_received_; }
    uint64_t GetTotalBytesSent() const { return total_bytes_sent_; }

    void AddBytesReceived(uint64_t bytes) { total_bytes_received_ += bytes; }
    void AddBytesSent(uint64_t bytes) { total_bytes_sent_ += bytes; }

private:
    void DoAccept();

private:
    const ServerConfig& config_;

    IoContextPool io_pool_;

    // Acceptor runs on its own context and thread
    asio::io_context acceptor_io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread acceptor_thread_;
    uint16_t bound_port_;

    std::shared_ptr<SessionManager> session_manager_;
    std::shared_ptr<ProtocolHandler> handler_;

    std::set<TcpConnection::Ptr> connections_;
    mutable std::mutex connections_mutex_;

    std::atomic<bool> running_;

    std::atomic<uint64_t> total_connections_;
    std::atomic<uint64_t> total_bytes_received_;
    std::atomic<uint64_t> total_bytes_sent_;
};

} // namespace mcpd_server
