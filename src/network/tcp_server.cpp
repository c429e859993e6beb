//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// network/tcp_server.cpp
//
// TCP server implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "config/server_config.hpp"
#include "protocol/protocol_handler.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"

namespace mcpd_server {

TcpServer::TcpServer(const ServerConfig& config,
                     std::shared_ptr<SessionManager> session_manager,
                     std::shared_ptr<ProtocolHandler> handler)
    : config_(config)
    , io_pool_(config.GetIoThreadCount())
    , acceptor_(acceptor_io_context_)
    , bound_port_(0)
    , session_manager_(std::move(session_manager))
    , handler_(std::move(handler))
    , running_(false)
    , total_connections_(0)
    , total_bytes_received_(0)
    , total_bytes_sent_(0) {
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::Start() {
    if (running_) {
        return;
    }

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;

    io_pool_.Start();

    DoAccept();

    acceptor_thread_ = std::thread([this]() {
        acceptor_io_context_.run();
    });

    LOG_INFO("server", "MCPD Server listening on " + config_.host + ":" +
             std::to_string(bound_port_));
}

void TcpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    acceptor_.close(ec);
    acceptor_io_context_.stop();

    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }

    // Close outside the lock; Close() removes the connection from the set
    std::vector<TcpConnection::Ptr> live;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        live.assign(connections_.begin(), connections_.end());
    }
    for (auto& conn : live) {
        conn->Close("server shutdown");
    }

    io_pool_.Stop();

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.clear();
    }

    LOG_INFO("server", "MCPD Server stopped");
}

void TcpServer::AddConnection(const TcpConnection::Ptr& conn) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(conn);
    total_connections_++;
}

void TcpServer::RemoveConnection(const TcpConnection::Ptr& conn) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(conn);
}

size_t TcpServer::GetConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::DoAccept() {
    if (!running_) {
        return;
    }

    auto conn = std::make_shared<TcpConnection>(io_pool_.Acquire(), *this, handler_,
                                                static_cast<size_t>(config_.max_message_bytes));

    acceptor_.async_accept(conn->GetSocket(),
        [this, conn](const asio::error_code& ec) {
            if (ec) {
                if (running_) {
                    LOG_WARN("server", "Accept error: " + ec.message());
                    DoAccept();
                }
                return;
            }

            AddConnection(conn);

            // Start on the connection's own thread
            asio::post(conn->GetSocket().get_executor(), [conn]() {
                conn->Start();
            });

            DoAccept();
        });
}

} // namespace mcpd_server
