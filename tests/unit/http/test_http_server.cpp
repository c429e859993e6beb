//===----------------------------------------------------------------------===//
//                         MCPD Server - Unit Tests
//
// tests/unit/http/test_http_server.cpp
//
// Unit tests for the health/metrics HTTP endpoint
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "metrics/metrics.hpp"
#include <nlohmann/json.hpp>
#include <cassert>
#include <iostream>

using namespace mcpd_server;
using nlohmann::json;

static std::unique_ptr<HttpServer> MakeServer(std::shared_ptr<Metrics> metrics, size_t connections) {
    return std::make_unique<HttpServer>("127.0.0.1", 0, std::move(metrics),
                                        [connections]() { return connections; });
}

void TestHealth() {
    std::cout << "  Testing GET /health..." << std::endl;

    auto server = MakeServer(std::make_shared<Metrics>(), 3);
    auto response = server->HandleRequest("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");

    assert(response.status_code == 200);
    assert(response.content_type == "application/json");
    json body = json::parse(response.body);
    assert(body["status"] == "healthy");
    assert(body["connections"] == 3);

    // Query strings are ignored
    assert(server->HandleRequest("GET /health?verbose=1 HTTP/1.1\r\n\r\n").status_code == 200);

    std::cout << "    PASSED" << std::endl;
}

void TestMetrics() {
    std::cout << "  Testing GET /metrics..." << std::endl;

    auto metrics = std::make_shared<Metrics>();
    metrics->RecordCompletion(std::chrono::milliseconds(4));
    metrics->RecordCompletion(std::chrono::milliseconds(6));

    auto server = MakeServer(metrics, 0);
    auto response = server->HandleRequest("GET /metrics HTTP/1.1\r\n\r\n");

    assert(response.status_code == 200);
    json body = json::parse(response.body);
    assert(body["queries_executed"] == 2);
    assert(body["avg_latency_ms"] == 5.0);
    assert(body["active_tasks"] == 0);
    assert(body.contains("uptime_seconds"));

    std::cout << "    PASSED" << std::endl;
}

void TestNotFoundAndMethodNotAllowed() {
    std::cout << "  Testing 404 / 405..." << std::endl;

    auto server = MakeServer(std::make_shared<Metrics>(), 0);

    auto missing = server->HandleRequest("GET /status HTTP/1.1\r\n\r\n");
    assert(missing.status_code == 404);
    assert(missing.content_type == "text/plain");

    auto post = server->HandleRequest("POST /health HTTP/1.1\r\n\r\n");
    assert(post.status_code == 405);

    // Unknown path wins over unsupported method
    assert(server->HandleRequest("DELETE /nowhere HTTP/1.1\r\n\r\n").status_code == 404);

    // Garbage request line
    assert(server->HandleRequest("").status_code == 404);

    std::cout << "    PASSED" << std::endl;
}

void TestSerialize() {
    std::cout << "  Testing response serialization..." << std::endl;

    HttpServer::HttpResponse response;
    response.body = "{}";
    std::string wire = response.Serialize();

    assert(wire.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(wire.find("Content-Type: application/json\r\n") != std::string::npos);
    assert(wire.find("Content-Length: 2\r\n") != std::string::npos);
    assert(wire.substr(wire.size() - 6) == "\r\n\r\n{}");

    std::cout << "    PASSED" << std::endl;
}

void TestLoopbackRequest() {
    std::cout << "  Testing a live request over loopback..." << std::endl;

    auto server = MakeServer(std::make_shared<Metrics>(), 7);
    server->Start();
    assert(server->GetPort() != 0);

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server->GetPort()));

    std::string request = "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n";
    asio::write(socket, asio::buffer(request));

    std::string reply;
    asio::error_code ec;
    asio::read(socket, asio::dynamic_buffer(reply), ec);
    assert(ec == asio::error::eof || !ec);

    assert(reply.rfind("HTTP/1.1 200 OK", 0) == 0);
    json body = json::parse(reply.substr(reply.find("\r\n\r\n") + 4));
    assert(body["connections"] == 7);

    server->Stop();

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== HttpServer Unit Tests ===" << std::endl;

    TestHealth();
    TestMetrics();
    TestNotFoundAndMethodNotAllowed();
    TestSerialize();
    TestLoopbackRequest();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
