//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/query_types.cpp
//
// Query rendering and result serialization
//===----------------------------------------------------------------------===//

#include "query/query_types.hpp"
#include <sstream>

namespace mcpd_server {

std::string Query::ToString() const {
    if (kind == QueryKind::SHOW_TABLES) {
        return "SHOW TABLES";
    }

    std::ostringstream sql;
    sql << "SELECT * FROM " << table;
    for (size_t i = 0; i < filters.size(); ++i) {
        const auto& filter = filters[i];
        sql << (i == 0 ? " WHERE " : " AND ")
            << filter.column
            << (filter.op == FilterOp::EQ ? " = " : " >= ")
            << filter.value.dump();
    }
    return sql.str();
}

nlohmann::json QueryResult::ToJson() const {
    nlohmann::json rows_json = nlohmann::json::array();
    for (const auto& row : rows) {
        rows_json.push_back(row);
    }

    return {
        {"columns", columns},
        {"rows", std::move(rows_json)},
        {"row_count", row_count},
        {"query_time_ms", query_time_ms}
    };
}

const char* QueryErrorCodeToString(QueryErrorCode code) {
    switch (code) {
        case QueryErrorCode::UNSUPPORTED_QUERY: return "UNSUPPORTED_QUERY";
        case QueryErrorCode::CANCELLED: return "CANCELLED";
        case QueryErrorCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        case QueryErrorCode::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

} // namespace mcpd_server
