//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// http/http_server.cpp
//
// HTTP endpoint implementation
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "metrics/metrics.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <sstream>

namespace mcpd_server {

namespace {

HttpServer::HttpResponse PlainResponse(int status_code, const std::string& status_text) {
    HttpServer::HttpResponse response;
    response.status_code = status_code;
    response.status_text = status_text;
    response.content_type = "text/plain";
    response.body = status_text;
    return response;
}

} // anonymous namespace

std::string HttpServer::HttpResponse::Serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code << " " << status_text << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

HttpServer::HttpServer(const std::string& host, uint16_t port,
                       std::shared_ptr<Metrics> metrics,
                       ConnectionCountCallback connection_count)
    : acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address(host), port))
    , port_(acceptor_.local_endpoint().port())
    , metrics_(std::move(metrics))
    , connection_count_(std::move(connection_count)) {
}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_.exchange(true)) {
        return;
    }

    DoAccept();

    thread_ = std::thread([this]() {
        io_context_.run();
    });

    LOG_INFO("http", "HTTP server started on port " + std::to_string(port_));
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_INFO("http", "HTTP server stopped");
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        if (!ec && running_) {
            HandleConnection(std::move(socket));
        } else if (ec && running_) {
            LOG_WARN("http", "Accept error: " + ec.message());
        }
        if (running_ && acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void HttpServer::HandleConnection(asio::ip::tcp::socket socket) {
    auto sock = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
    auto buf = std::make_shared<std::array<char, 4096>>();

    // Requests are tiny; the request line arrives in the first read
    sock->async_read_some(asio::buffer(*buf),
        [this, sock, buf](std::error_code ec, size_t bytes_read) {
            if (ec) {
                return;
            }

            auto response = std::make_shared<std::string>(
                HandleRequest(std::string(buf->data(), bytes_read)).Serialize());

            asio::async_write(*sock, asio::buffer(*response),
                [sock, response](std::error_code write_ec, size_t) {
                    if (write_ec) {
                        LOG_DEBUG("http", "Write failed: " + write_ec.message());
                    }
                    asio::error_code close_ec;
                    sock->shutdown(asio::ip::tcp::socket::shutdown_both, close_ec);
                    sock->close(close_ec);
                });
        });
}

HttpServer::HttpResponse HttpServer::HandleRequest(const std::string& request) const {
    std::istringstream iss(request);
    std::string method, target;
    iss >> method >> target;

    // Ignore any query string
    std::string path = target.substr(0, target.find('?'));

    if (path != "/health" && path != "/metrics") {
        return PlainResponse(404, "Not Found");
    }
    if (method != "GET") {
        return PlainResponse(405, "Method Not Allowed");
    }

    HttpResponse response;
    if (path == "/health") {
        nlohmann::json body = {
            {"status", "healthy"},
            {"connections", connection_count_ ? connection_count_() : 0}
        };
        response.body = body.dump();
    } else {
        response.body = metrics_ ? metrics_->ToJson().dump() : "{}";
    }
    return response;
}

} // namespace mcpd_server
