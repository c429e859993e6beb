//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// network/tcp_connection.cpp
//
// TCP connection implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_connection.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"

namespace mcpd_server {

std::atomic<uint64_t> TcpConnection::next_connection_id_{1};

TcpConnection::TcpConnection(IoContextPool::Lease lease,
                             TcpServer& server,
                             std::shared_ptr<ProtocolHandler> handler,
                             size_t max_message_bytes)
    : lease_(std::move(lease))
    , socket_(lease_.Context())
    , server_(server)
    , handler_(std::move(handler))
    , connection_id_(next_connection_id_.fetch_add(1))
    , connected_(false)
    , read_buffer_(max_message_bytes + 1)
    , writing_(false)
    , bytes_received_(0)
    , bytes_sent_(0)
    , messages_received_(0) {
}

TcpConnection::~TcpConnection() {
    asio::error_code ec;
    socket_.close(ec);
}

void TcpConnection::Start() {
    connected_ = true;

    std::weak_ptr<TcpConnection> weak = shared_from_this();
    session_ = server_.GetSessionManager()->CreateSession(
        [weak](std::string frame) {
            if (auto conn = weak.lock()) {
                conn->Send(std::move(frame));
            }
        },
        [weak](const std::string& reason) {
            if (auto conn = weak.lock()) {
                conn->Close(reason);
            }
        });

    if (!session_) {
        LOG_WARN("connection", "Connection " + std::to_string(connection_id_) +
                 " from " + GetRemoteAddress() + " rejected: session limit reached");
        Close("session limit reached");
        return;
    }
    session_->SetPeerAddress(GetRemoteAddress());

    LOG_DEBUG("connection", "Connection " + std::to_string(connection_id_) +
              " started from " + GetRemoteAddress() +
              " (session " + std::to_string(session_->GetSessionId()) + ")");

    handler_->OpenSession(session_);
    DoRead();
}

void TcpConnection::Close(const std::string& reason) {
    if (!connected_.exchange(false)) {
        return;
    }

    LOG_DEBUG("connection", "Connection " + std::to_string(connection_id_) + " closing: " + reason);

    auto self = shared_from_this();
    if (session_) {
        session_->Close(reason);
        server_.GetSessionManager()->RemoveSession(session_->GetSessionId());
    }

    // The socket is only touched from its own executor
    asio::post(socket_.get_executor(), [self]() {
        asio::error_code ec;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        self->socket_.close(ec);
    });

    server_.RemoveConnection(self);
}

void TcpConnection::Send(std::string frame) {
    if (!connected_) {
        return;
    }

    frame.push_back('\n');

    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self, frame = std::move(frame)]() mutable {
        self->write_queue_.push_back(std::move(frame));
        if (!self->writing_) {
            self->writing_ = true;
            self->DoWrite();
        }
    });
}

std::string TcpConnection::GetRemoteAddress() const {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void TcpConnection::DoRead() {
    if (!connected_) {
        return;
    }

    auto self = shared_from_this();

    asio::async_read_until(socket_, read_buffer_, '\n',
        [this, self](const asio::error_code& ec, size_t bytes_transferred) {
            if (ec) {
                if (ec == asio::error::not_found) {
                    LOG_WARN("connection", "Connection " + std::to_string(connection_id_) +
                             " sent a line longer than " +
                             std::to_string(read_buffer_.max_size() - 1) + " bytes");
                    Close("message too large");
                } else if (ec == asio::error::eof || ec == asio::error::operation_aborted) {
                    Close("peer disconnected");
                } else {
                    HandleError("read", ec);
                    Close("read error");
                }
                return;
            }

            bytes_received_ += bytes_transferred;
            server_.AddBytesReceived(bytes_transferred);

            std::string line(asio::buffers_begin(read_buffer_.data()),
                             asio::buffers_begin(read_buffer_.data()) + bytes_transferred - 1);
            read_buffer_.consume(bytes_transferred);

            ProcessLine(std::move(line));
        });
}

void TcpConnection::ProcessLine(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // Blank keep-alive lines are not envelopes
    if (line.find_first_not_of(" \t") == std::string::npos) {
        DoRead();
        return;
    }

    messages_received_++;
    LOG_TRACE("connection", "Received " + std::to_string(line.size()) +
              " bytes on connection " + std::to_string(connection_id_));

    if (!handler_->HandleMessage(line, session_)) {
        // Malformed input; the session close already closed this connection
        Close("malformed envelope");
        return;
    }

    DoRead();
}

void TcpConnection::DoWrite() {
    if (write_queue_.empty() || !socket_.is_open()) {
        writing_ = false;
        return;
    }

    auto self = shared_from_this();

    // deque::push_back keeps references to existing elements valid
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](const asio::error_code& ec, size_t bytes_transferred) {
            write_queue_.pop_front();

            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    HandleError("write", ec);
                }
                write_queue_.clear();
                writing_ = false;
                Close("write error");
                return;
            }

            bytes_sent_ += bytes_transferred;
            server_.AddBytesSent(bytes_transferred);

            DoWrite();
        });
}

void TcpConnection::HandleError(const std::string& operation, const asio::error_code& ec) {
    LOG_WARN("connection", "Error on connection " + std::to_string(connection_id_) +
             " during " + operation + ": " + ec.message());
}

} // namespace mcpd_server
