//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/query_types.hpp
//
// Query, result and batch definitions shared by all query sources
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace mcpd_server {

// Cell values are tagged (null/bool/number/string)
using Value = nlohmann::json;
using Row = std::vector<Value>;

//===----------------------------------------------------------------------===//
// Query
//===----------------------------------------------------------------------===//
enum class QueryKind : uint8_t {
    SHOW_TABLES = 0,
    SELECT = 1
};

enum class FilterOp : uint8_t {
    EQ = 0,   // column == value
    GE = 1    // column >= value (numeric)
};

struct Filter {
    std::string column;
    FilterOp op = FilterOp::EQ;
    Value value;
};

struct Query {
    QueryKind kind = QueryKind::SELECT;
    std::string table;
    std::vector<Filter> filters;

    static Query ShowTables() {
        Query q;
        q.kind = QueryKind::SHOW_TABLES;
        return q;
    }

    static Query Select(std::string table_name, std::vector<Filter> where = {}) {
        Query q;
        q.kind = QueryKind::SELECT;
        q.table = std::move(table_name);
        q.filters = std::move(where);
        return q;
    }

    // SQL-like rendering for logs and error messages
    std::string ToString() const;
};

//===----------------------------------------------------------------------===//
// Results
//===----------------------------------------------------------------------===//
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    size_t row_count = 0;
    int64_t query_time_ms = 0;

    nlohmann::json ToJson() const;
};

struct StreamBatch {
    uint64_t sequence = 0;
    std::vector<Row> rows;
};

//===----------------------------------------------------------------------===//
// Errors
//===----------------------------------------------------------------------===//
enum class QueryErrorCode : uint8_t {
    UNSUPPORTED_QUERY = 1,
    CANCELLED = 2,
    DEADLINE_EXCEEDED = 3,
    INTERNAL = 4
};

const char* QueryErrorCodeToString(QueryErrorCode code);

class QueryError : public std::runtime_error {
public:
    QueryError(QueryErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    QueryErrorCode GetCode() const { return code_; }

    bool IsCancellation() const {
        return code_ == QueryErrorCode::CANCELLED || code_ == QueryErrorCode::DEADLINE_EXCEEDED;
    }

private:
    QueryErrorCode code_;
};

} // namespace mcpd_server
