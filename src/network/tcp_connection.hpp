//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// network/tcp_connection.hpp
//
// Newline-delimited JSON connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include <asio.hpp>
#include <deque>

namespace mcpd_server {

class TcpServer;
class ProtocolHandler;

// Reads one envelope per line and hands it to the protocol handler. All
// socket work, writes included, runs on the connection's io_context thread;
// Send() may be called from any thread.
class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    using Ptr = std::shared_ptr<TcpConnection>;

    TcpConnection(IoContextPool::Lease lease,
                  TcpServer& server,
                  std::shared_ptr<ProtocolHandler> handler,
                  size_t max_message_bytes);
    ~TcpConnection();

    // Non-copyable
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    asio::ip::tcp::socket& GetSocket() { return socket_; }

    // Register a session, send the identity message and start reading
    void Start();

    // Idempotent; also closes the session
    void Close(const std::string& reason);

    // Queue one frame; a newline is appended
    void Send(std::string frame);

    std::string GetRemoteAddress() const;

    uint64_t GetConnectionId() const { return connection_id_; }

    bool IsConnected() const { return connected_; }

    uint64_t GetSessionId() const { return session_ ? session_->GetSessionId() : 0; }

private:
    void DoRead();

    void ProcessLine(std::string line);

    void DoWrite();

    void HandleError(const std::string& operation, const asio::error_code& ec);

private:
    // Declared before socket_, which is built on the leased context
    IoContextPool::Lease lease_;

    asio::ip::tcp::socket socket_;

    TcpServer& server_;

    std::shared_ptr<ProtocolHandler> handler_;

    SessionPtr session_;

    uint64_t connection_id_;

    std::atomic<bool> connected_;

    // Bounded to max_message_bytes + 1 so an oversized line fails the read
    asio::streambuf read_buffer_;

    // Only touched on the io_context thread
    std::deque<std::string> write_queue_;
    bool writing_;

    std::atomic<uint64_t> bytes_received_;
    std::atomic<uint64_t> bytes_sent_;
    std::atomic<uint64_t> messages_received_;

    static std::atomic<uint64_t> next_connection_id_;
};

} // namespace mcpd_server
