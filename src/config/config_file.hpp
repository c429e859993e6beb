//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// config/config_file.hpp
//
// Legacy key = value configuration file
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <string>

namespace mcpd_server {

// One "key = value" pair per line. Blank lines and lines starting with '#'
// or ';' are ignored; values may be quoted.
class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }

        values_.clear();
        std::string line;
        int line_num = 0;
        while (std::getline(file, line)) {
            line_num++;
            line = Trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                error_ = "Invalid syntax at line " + std::to_string(line_num) + ": missing '='";
                return false;
            }

            std::string key = Trim(line.substr(0, eq_pos));
            if (key.empty()) {
                error_ = "Invalid syntax at line " + std::to_string(line_num) + ": empty key";
                return false;
            }

            values_[key] = Unquote(Trim(line.substr(eq_pos + 1)));
        }

        return true;
    }

    bool Has(const std::string& key) const {
        return values_.count(key) > 0;
    }

    std::string GetString(const std::string& key, const std::string& default_val = "") const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_val;
    }

    // Leaves `out` untouched when the key is absent. Returns false and sets
    // the error when the value is not an unsigned integer no larger than max.
    bool GetUint(const std::string& key, uint64_t& out,
                 uint64_t max = std::numeric_limits<uint64_t>::max()) {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return true;
        }

        const std::string& text = it->second;
        char* end = nullptr;
        errno = 0;
        unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
        if (text.empty() || text[0] == '-' || *end != '\0' || errno == ERANGE || parsed > max) {
            error_ = "Invalid value for '" + key + "': " + text;
            return false;
        }
        out = parsed;
        return true;
    }

    size_t Size() const { return values_.size(); }

    const std::string& GetError() const { return error_; }

private:
    static std::string Trim(const std::string& s) {
        auto first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            return "";
        }
        auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    static std::string Unquote(const std::string& value) {
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    std::map<std::string, std::string> values_;
    std::string error_;
};

} // namespace mcpd_server
