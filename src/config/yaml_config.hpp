//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// config/yaml_config.hpp
//
// YAML configuration file with dot-path lookup
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace mcpd_server {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }

        if (root_ && !root_.IsNull() && !root_.IsMap()) {
            error_ = "YAML config root must be a mapping";
            return false;
        }
        return true;
    }

    bool LoadString(const std::string& text) {
        try {
            root_ = YAML::Load(text);
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
        return true;
    }

    // True if "section.key" names a non-null node
    bool Has(const std::string& path) const {
        YAML::Node node = Lookup(path);
        return node && !node.IsNull();
    }

    // Leaves `out` untouched when the path is absent. Returns false and sets
    // the error when the value cannot be converted.
    template<typename T>
    bool Get(const std::string& path, T& out) {
        YAML::Node node = Lookup(path);
        if (!node || node.IsNull()) {
            return true;
        }
        try {
            out = node.as<T>();
        } catch (const YAML::Exception&) {
            error_ = "Invalid value for '" + path + "': " + node.Scalar();
            return false;
        }
        return true;
    }

    const std::string& GetError() const { return error_; }

private:
    // Walks const nodes so the lookup never inserts into the document
    YAML::Node Lookup(const std::string& path) const {
        std::vector<std::string> keys;
        size_t start = 0;
        size_t dot;
        while ((dot = path.find('.', start)) != std::string::npos) {
            keys.push_back(path.substr(start, dot - start));
            start = dot + 1;
        }
        keys.push_back(path.substr(start));
        return Descend(root_, keys, 0);
    }

    static YAML::Node Descend(const YAML::Node& node, const std::vector<std::string>& keys, size_t depth) {
        if (depth == keys.size()) {
            return node;
        }
        if (!node.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node child = node[keys[depth]];
        if (!child) {
            return YAML::Node();
        }
        return Descend(child, keys, depth + 1);
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace mcpd_server
