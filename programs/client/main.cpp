//===----------------------------------------------------------------------===//
//                         MCPD CLI
//
// programs/client/main.cpp
//
// Interactive shell for an MCPD server.
//
// Usage:
//   mcpd-cli                    -- connects to localhost:9000
//   mcpd-cli HOST PORT
//
// Commands:
//   .tools                      list the server's tools
//   .call TOOL [JSON-ARGS]      invoke a tool, e.g. .call query_albums {"era":"Pop"}
//===----------------------------------------------------------------------===//

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using asio::ip::tcp;
using nlohmann::json;

static std::string Trim(const std::string &s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static void PrintHelp() {
    std::cout <<
        "\nMCPD CLI\n"
        "\nCommands:\n"
        "  .help                     Show this message\n"
        "  .quit / .exit             Exit the shell\n"
        "  .tools                    List available tools\n"
        "  .call TOOL [JSON-ARGS]    Invoke a tool\n"
        "\nExamples:\n"
        "  .call list_tables\n"
        "  .call query_songs {\"min_streams\": 2000}\n"
        "  .call streaming_query {\"table\": \"songs\", \"batch_size\": 5}\n\n";
}

// Blocking line-oriented connection
class Connection {
public:
    Connection() : socket_(io_) {}

    void Connect(const std::string &host, const std::string &port) {
        tcp::resolver resolver(io_);
        asio::connect(socket_, resolver.resolve(host, port));
    }

    void WriteLine(const std::string &line) {
        std::string frame = line + "\n";
        asio::write(socket_, asio::buffer(frame));
    }

    std::string ReadLine() {
        asio::read_until(socket_, buffer_, '\n');
        std::istream is(&buffer_);
        std::string line;
        std::getline(is, line);
        return line;
    }

    // Send a request and wait for the response with the same id
    json Call(const std::string &method, json params) {
        std::string id = std::to_string(++next_id_);
        json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.is_null()) request["params"] = std::move(params);
        WriteLine(request.dump());

        while (true) {
            json response = json::parse(ReadLine());
            if (response.value("id", json()) == id) return response;
        }
    }

private:
    asio::io_context io_;
    tcp::socket socket_;
    asio::streambuf buffer_;
    uint64_t next_id_ = 0;
};

static void PrintRows(const json &result) {
    const auto &columns = result["columns"];
    for (size_t c = 0; c < columns.size(); c++) {
        if (c) std::cout << "\t";
        std::cout << columns[c].get<std::string>();
    }
    std::cout << "\n";
    for (size_t c = 0; c < columns.size(); c++) {
        if (c) std::cout << "\t";
        std::cout << std::string(columns[c].get<std::string>().size(), '-');
    }
    std::cout << "\n";

    for (const auto &row : result["rows"]) {
        for (size_t c = 0; c < row.size(); c++) {
            if (c) std::cout << "\t";
            std::cout << (row[c].is_string() ? row[c].get<std::string>() : row[c].dump());
        }
        std::cout << "\n";
    }

    size_t rows = result.value("row_count", result["rows"].size());
    std::cout << "(" << rows << " row" << (rows != 1 ? "s" : "") << ", "
              << result.value("query_time_ms", 0) << " ms)\n";
}

static void PrintResponse(const json &response) {
    if (response.contains("error")) {
        const auto &error = response["error"];
        std::cerr << "Error " << error.value("code", 0) << ": "
                  << error.value("message", std::string()) << "\n";
        return;
    }

    const auto &result = response["result"];
    if (result.is_object() && result.contains("columns") && result.contains("rows")) {
        std::cout << "\n";
        PrintRows(result);
        if (result.contains("summary")) {
            std::cout << "summary: " << result["summary"].dump(2) << "\n";
        }
        std::cout << "\n";
    } else {
        std::cout << result.dump(2) << "\n";
    }
}

static void PrintTools(const json &response) {
    if (response.contains("error")) {
        PrintResponse(response);
        return;
    }
    std::cout << "\n";
    for (const auto &tool : response["result"]["tools"]) {
        std::cout << "  " << tool["name"].get<std::string>() << " - "
                  << tool["description"].get<std::string>() << "\n";
        for (const auto &prop : tool["inputSchema"]["properties"].items()) {
            std::cout << "      " << prop.key() << " (" << prop.value()["type"].get<std::string>()
                      << "): " << prop.value()["description"].get<std::string>() << "\n";
        }
    }
    std::cout << "\n";
}

int main(int argc, char *argv[]) {
    std::string host = "localhost";
    std::string port = "9000";

    if (argc >= 2) {
        std::string a = argv[1];
        if (a == "--help" || a == "-h") {
            std::cout <<
                "Usage: " << argv[0] << " [HOST] [PORT]\n"
                "\n"
                "  HOST   MCPD server host  (default: localhost)\n"
                "  PORT   MCPD server port  (default: $PORT or 9000)\n";
            return 0;
        }
        host = a;
    }
    if (argc >= 3) {
        port = argv[2];
    } else if (const char *env_port = std::getenv("PORT")) {
        port = env_port;
    }

    Connection conn;
    try {
        conn.Connect(host, port);
        json identity = json::parse(conn.ReadLine());
        const auto &info = identity["result"]["serverInfo"];
        std::cout << "Connected to " << info.value("name", std::string("?")) << " "
                  << info.value("version", std::string("?")) << " at " << host << ":" << port
                  << " (protocol " << identity["result"].value("protocolVersion", std::string("?"))
                  << ")\n.help for commands  |  .quit to exit\n\n";
    } catch (const std::exception &e) {
        std::cerr << "Failed to connect to " << host << ":" << port << ": " << e.what() << "\n";
        return 1;
    }

    using_history();

    while (true) {
        char *raw = readline("mcpd> ");
        if (!raw) { std::cout << "\nBye!\n"; break; }

        std::string line = Trim(raw);
        free(raw);

        if (line.empty()) continue;
        add_history(line.c_str());

        std::string command = line.substr(0, line.find(' '));
        std::transform(command.begin(), command.end(), command.begin(), ::tolower);
        std::string rest = Trim(line.substr(command.size()));

        try {
            if (command == ".quit" || command == ".exit" || command == ".q") {
                std::cout << "Bye!\n";
                break;
            } else if (command == ".help" || command == ".h") {
                PrintHelp();
            } else if (command == ".tools") {
                PrintTools(conn.Call("tools/list", json()));
            } else if (command == ".call") {
                std::string tool = rest.substr(0, rest.find(' '));
                if (tool.empty()) {
                    std::cerr << "Usage: .call TOOL [JSON-ARGS]\n";
                    continue;
                }
                std::string args_text = Trim(rest.substr(tool.size()));
                json args = args_text.empty() ? json::object() : json::parse(args_text);
                PrintResponse(conn.Call("tools/call", {{"name", tool}, {"arguments", args}}));
            } else {
                std::cerr << "Unknown command: " << command << " (.help for commands)\n";
            }
        } catch (const json::exception &e) {
            std::cerr << "Invalid JSON: " << e.what() << "\n";
        } catch (const asio::system_error &e) {
            std::cerr << "Connection lost: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}
