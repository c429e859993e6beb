//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// tools/tool_registry.cpp
//
// Tool registry implementation
//===----------------------------------------------------------------------===//

#include "tools/tool_registry.hpp"
#include <cmath>
#include <stdexcept>

namespace mcpd_server {

const char* ArgumentTypeToString(ArgumentType type) {
    switch (type) {
        case ArgumentType::STRING: return "string";
        case ArgumentType::NUMBER: return "number";
        case ArgumentType::INTEGER: return "integer";
        case ArgumentType::BOOLEAN: return "boolean";
        case ArgumentType::OBJECT: return "object";
        case ArgumentType::ARRAY: return "array";
        default: return "unknown";
    }
}

bool ArgumentTypeMatches(ArgumentType type, const nlohmann::json& value) {
    switch (type) {
        case ArgumentType::STRING: return value.is_string();
        case ArgumentType::NUMBER: return value.is_number();
        case ArgumentType::INTEGER:
            if (value.is_number_integer()) {
                return true;
            }
            // 5.0 is an acceptable integer
            if (value.is_number_float()) {
                double v = value.get<double>();
                return std::isfinite(v) && std::trunc(v) == v;
            }
            return false;
        case ArgumentType::BOOLEAN: return value.is_boolean();
        case ArgumentType::OBJECT: return value.is_object();
        case ArgumentType::ARRAY: return value.is_array();
        default: return false;
    }
}

//===----------------------------------------------------------------------===//
// ToolDescriptor
//===----------------------------------------------------------------------===//

const ArgumentSpec* ToolDescriptor::FindArgument(const std::string& arg_name) const {
    for (const auto& arg : arguments) {
        if (arg.name == arg_name) {
            return &arg;
        }
    }
    return nullptr;
}

nlohmann::json ToolDescriptor::ToJson() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& arg : arguments) {
        properties[arg.name] = {
            {"type", ArgumentTypeToString(arg.type)},
            {"description", arg.description}
        };
        if (arg.required) {
            required.push_back(arg.name);
        }
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", std::move(properties)}
    };
    if (!required.empty()) {
        schema["required"] = std::move(required);
    }

    return {
        {"name", name},
        {"description", description},
        {"inputSchema", std::move(schema)}
    };
}

//===----------------------------------------------------------------------===//
// ToolRegistry
//===----------------------------------------------------------------------===//

void ToolRegistry::Register(ToolDescriptor descriptor) {
    if (descriptor.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (Find(descriptor.name) != nullptr) {
        throw std::invalid_argument("duplicate tool name: " + descriptor.name);
    }
    tools_.push_back(std::move(descriptor));
}

const ToolDescriptor* ToolRegistry::Find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

nlohmann::json ToolRegistry::ToJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools_) {
        list.push_back(tool.ToJson());
    }
    return {{"tools", std::move(list)}};
}

std::shared_ptr<ToolRegistry> BuildDefaultRegistry() {
    auto registry = std::make_shared<ToolRegistry>();

    registry->Register({
        tool_names::LIST_TABLES,
        "List all available tables in the Taylor Swift database",
        {}
    });

    registry->Register({
        tool_names::QUERY_ALBUMS,
        "Query Taylor Swift albums with optional filters",
        {
            {"era", ArgumentType::STRING, "Filter by era (e.g., 'Pop', 'Country', 'Indie Folk')", false}
        }
    });

    registry->Register({
        tool_names::QUERY_SONGS,
        "Query Taylor Swift songs with streaming and chart data",
        {
            {"album_id", ArgumentType::STRING, "Filter by album ID", false},
            {"min_streams", ArgumentType::NUMBER, "Minimum streams in millions", false}
        }
    });

    registry->Register({
        tool_names::ANALYZE_TOURS,
        "Analyze Taylor Swift tour data including revenue and attendance",
        {}
    });

    registry->Register({
        tool_names::STREAMING_QUERY,
        "Execute a large query with streaming results (for demo)",
        {
            {"table", ArgumentType::STRING, "Table to query (albums, songs, tours)", true},
            {"batch_size", ArgumentType::INTEGER, "Rows per batch (default 5)", false}
        }
    });

    return registry;
}

} // namespace mcpd_server
