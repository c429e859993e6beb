//===----------------------------------------------------------------------===//
//                         MCPD Server - Unit Tests
//
// tests/unit/tools/test_tool_registry.cpp
//
// Unit tests for ToolRegistry and the default tool catalog
//===----------------------------------------------------------------------===//

#include "tools/tool_registry.hpp"
#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace mcpd_server;
using nlohmann::json;

void TestDefaultRegistryOrder() {
    std::cout << "  Testing default registry lists five tools in order..." << std::endl;

    auto registry = BuildDefaultRegistry();
    assert(registry->Size() == 5);

    const auto& tools = registry->List();
    assert(tools[0].name == "list_tables");
    assert(tools[1].name == "query_albums");
    assert(tools[2].name == "query_songs");
    assert(tools[3].name == "analyze_tours");
    assert(tools[4].name == "streaming_query");

    std::cout << "    PASSED" << std::endl;
}

void TestFind() {
    std::cout << "  Testing Find / FindArgument..." << std::endl;

    auto registry = BuildDefaultRegistry();
    const ToolDescriptor* songs = registry->Find("query_songs");
    assert(songs != nullptr);
    assert(songs->arguments.size() == 2);

    const ArgumentSpec* min_streams = songs->FindArgument("min_streams");
    assert(min_streams != nullptr);
    assert(min_streams->type == ArgumentType::NUMBER);
    assert(!min_streams->required);
    assert(songs->FindArgument("era") == nullptr);

    assert(registry->Find("drop_tables") == nullptr);
    assert(registry->Find("") == nullptr);

    std::cout << "    PASSED" << std::endl;
}

void TestDescriptorSchema() {
    std::cout << "  Testing descriptor inputSchema..." << std::endl;

    auto registry = BuildDefaultRegistry();

    json stream = registry->Find("streaming_query")->ToJson();
    assert(stream["name"] == "streaming_query");
    assert(stream["description"].is_string());
    assert(stream["inputSchema"]["type"] == "object");
    assert(stream["inputSchema"]["properties"]["table"]["type"] == "string");
    assert(stream["inputSchema"]["properties"]["batch_size"]["type"] == "integer");
    assert(stream["inputSchema"]["required"] == json::array({"table"}));

    // No required arguments: the key is omitted
    json albums = registry->Find("query_albums")->ToJson();
    assert(!albums["inputSchema"].contains("required"));
    assert(albums["inputSchema"]["properties"]["era"]["type"] == "string");

    json tables = registry->Find("list_tables")->ToJson();
    assert(tables["inputSchema"]["properties"].is_object());
    assert(tables["inputSchema"]["properties"].empty());

    std::cout << "    PASSED" << std::endl;
}

void TestRegistryToJson() {
    std::cout << "  Testing registry ToJson..." << std::endl;

    auto registry = BuildDefaultRegistry();
    json listing = registry->ToJson();
    assert(listing.contains("tools"));
    assert(listing["tools"].size() == 5);
    assert(listing["tools"][4]["name"] == "streaming_query");

    ToolRegistry empty;
    assert(empty.ToJson()["tools"].is_array());
    assert(empty.ToJson()["tools"].empty());

    std::cout << "    PASSED" << std::endl;
}

void TestRegisterRejectsBadNames() {
    std::cout << "  Testing Register rejects empty and duplicate names..." << std::endl;

    ToolRegistry registry;
    registry.Register({"echo", "Echo arguments", {}});

    bool threw = false;
    try {
        registry.Register({"echo", "Another echo", {}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        registry.Register({"", "Nameless", {}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(registry.Size() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestArgumentTypeMatches() {
    std::cout << "  Testing ArgumentTypeMatches..." << std::endl;

    assert(ArgumentTypeMatches(ArgumentType::STRING, "Pop"));
    assert(!ArgumentTypeMatches(ArgumentType::STRING, 5));

    assert(ArgumentTypeMatches(ArgumentType::NUMBER, 5));
    assert(ArgumentTypeMatches(ArgumentType::NUMBER, 2.5));
    assert(!ArgumentTypeMatches(ArgumentType::NUMBER, "5"));

    assert(ArgumentTypeMatches(ArgumentType::INTEGER, 5));
    assert(ArgumentTypeMatches(ArgumentType::INTEGER, 5.0));
    assert(!ArgumentTypeMatches(ArgumentType::INTEGER, 5.5));
    assert(!ArgumentTypeMatches(ArgumentType::INTEGER, true));

    // Out-of-range magnitudes are still integral values
    assert(ArgumentTypeMatches(ArgumentType::INTEGER, std::numeric_limits<uint64_t>::max()));
    assert(ArgumentTypeMatches(ArgumentType::INTEGER, -3));
    assert(ArgumentTypeMatches(ArgumentType::INTEGER, 1e300));
    assert(ArgumentTypeMatches(ArgumentType::INTEGER, -1e300));
    assert(!ArgumentTypeMatches(ArgumentType::INTEGER, std::numeric_limits<double>::infinity()));
    assert(!ArgumentTypeMatches(ArgumentType::INTEGER, std::numeric_limits<double>::quiet_NaN()));

    assert(ArgumentTypeMatches(ArgumentType::BOOLEAN, false));
    assert(ArgumentTypeMatches(ArgumentType::OBJECT, json::object()));
    assert(ArgumentTypeMatches(ArgumentType::ARRAY, json::array()));
    assert(!ArgumentTypeMatches(ArgumentType::OBJECT, json::array()));

    assert(std::string(ArgumentTypeToString(ArgumentType::INTEGER)) == "integer");

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== ToolRegistry Unit Tests ===" << std::endl;

    TestDefaultRegistryOrder();
    TestFind();
    TestDescriptorSchema();
    TestRegistryToJson();
    TestRegisterRejectsBadNames();
    TestArgumentTypeMatches();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
