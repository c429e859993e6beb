//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// tools/tool_registry.hpp
//
// Catalog of invocable tools and their argument shapes
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <nlohmann/json.hpp>

namespace mcpd_server {

enum class ArgumentType : uint8_t {
    STRING = 0,
    NUMBER = 1,
    INTEGER = 2,
    BOOLEAN = 3,
    OBJECT = 4,
    ARRAY = 5
};

const char* ArgumentTypeToString(ArgumentType type);

// True if `value` carries the JSON type declared by `type`
bool ArgumentTypeMatches(ArgumentType type, const nlohmann::json& value);

struct ArgumentSpec {
    std::string name;
    ArgumentType type = ArgumentType::STRING;
    std::string description;
    bool required = false;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ArgumentSpec> arguments;

    const ArgumentSpec* FindArgument(const std::string& arg_name) const;

    // {"name", "description", "inputSchema": {"type": "object", ...}}
    nlohmann::json ToJson() const;
};

class ToolRegistry {
public:
    ToolRegistry() = default;

    // Throws std::invalid_argument on an empty or duplicate name
    void Register(ToolDescriptor descriptor);

    // Registration order
    const std::vector<ToolDescriptor>& List() const { return tools_; }

    // nullptr if not registered
    const ToolDescriptor* Find(const std::string& name) const;

    size_t Size() const { return tools_.size(); }

    // {"tools": [...]}
    nlohmann::json ToJson() const;

private:
    std::vector<ToolDescriptor> tools_;
};

// Tool names served by the default registry
namespace tool_names {
constexpr const char* LIST_TABLES = "list_tables";
constexpr const char* QUERY_ALBUMS = "query_albums";
constexpr const char* QUERY_SONGS = "query_songs";
constexpr const char* ANALYZE_TOURS = "analyze_tours";
constexpr const char* STREAMING_QUERY = "streaming_query";
} // namespace tool_names

// The five catalog tools, in listing order
std::shared_ptr<ToolRegistry> BuildDefaultRegistry();

} // namespace mcpd_server
