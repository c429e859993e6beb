//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// http/http_server.hpp
//
// HTTP endpoint for health checks and metrics
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>

namespace mcpd_server {

// GET /health  -> {"status":"healthy","connections":N}
// GET /metrics -> metrics snapshot
// Other paths answer 404, other methods 405.
class HttpServer {
public:
    using ConnectionCountCallback = std::function<size_t()>;

    struct HttpResponse {
        int status_code = 200;
        std::string status_text = "OK";
        std::string content_type = "application/json";
        std::string body;

        std::string Serialize() const;
    };

    // Binds immediately; throws asio::system_error on failure
    HttpServer(const std::string& host, uint16_t port,
               std::shared_ptr<Metrics> metrics,
               ConnectionCountCallback connection_count);
    ~HttpServer();

    void Start();
    void Stop();

    uint16_t GetPort() const { return port_; }

    // Route one raw request (request line and headers)
    HttpResponse HandleRequest(const std::string& request) const;

private:
    void DoAccept();
    void HandleConnection(asio::ip::tcp::socket socket);

private:
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::shared_ptr<Metrics> metrics_;
    ConnectionCountCallback connection_count_;
};

} // namespace mcpd_server
