//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/mock_query_source.cpp
//
// In-memory query source implementation
//===----------------------------------------------------------------------===//

#include "query/mock_query_source.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

namespace mcpd_server {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool ValueEquals(const Value& cell, const Value& wanted) {
    if (cell.is_string() && wanted.is_string()) {
        return ToLower(cell.get<std::string>()) == ToLower(wanted.get<std::string>());
    }
    if (cell.is_number() && wanted.is_number()) {
        return cell.get<double>() == wanted.get<double>();
    }
    return cell == wanted;
}

} // anonymous namespace

MockQuerySource::MockQuerySource(const Options& options)
    : options_(options) {
    tables_["albums"] = AlbumsTable();
    tables_["songs"] = SongsTable();
    tables_["tours"] = ToursTable();

    LOG_DEBUG("query_source", "Mock catalog loaded with " +
              std::to_string(tables_.size()) + " tables");
}

QueryResult MockQuerySource::Execute(const Query& query, const CancellationToken& token) {
    auto start = Clock::now();

    // Simulated network round trip
    if (options_.latency.count() > 0) {
        if (token.WaitFor(options_.latency)) {
            ThrowCancelled(token);
        }
    } else if (token.IsCancelled()) {
        ThrowCancelled(token);
    }

    QueryResult result = query.kind == QueryKind::SHOW_TABLES ? ShowTables() : Select(query, token);
    result.query_time_ms = ElapsedMillis(start);

    LOG_TRACE("query_source", query.ToString() + " -> " + std::to_string(result.row_count) + " rows");
    return result;
}

std::unique_ptr<BatchStream> MockQuerySource::ExecuteStreaming(const Query& query,
                                                               size_t batch_size,
                                                               const CancellationToken& token) {
    if (batch_size == 0) {
        throw QueryError(QueryErrorCode::UNSUPPORTED_QUERY, "batch size must be at least 1");
    }

    auto stream = std::make_unique<BatchStream>(options_.channel_capacity, token);

    stream->Start([this, query, batch_size](BatchStream::Writer& writer) {
        // Materialize once, then slice
        QueryResult result = Execute(query, writer.Token());

        const size_t total = result.rows.size();
        for (size_t offset = 0; offset < total;) {
            if (writer.Token().IsCancelled()) {
                ThrowCancelled(writer.Token());
            }

            size_t end = offset + std::min(batch_size, total - offset);
            std::vector<Row> slice(std::make_move_iterator(result.rows.begin() + offset),
                                   std::make_move_iterator(result.rows.begin() + end));
            offset = end;

            if (!writer.Push(std::move(slice))) {
                ThrowCancelled(writer.Token());
            }

            if (options_.batch_delay.count() > 0 && !writer.Pause(options_.batch_delay)) {
                ThrowCancelled(writer.Token());
            }
        }
    });

    return stream;
}

std::vector<std::string> MockQuerySource::ListTables() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& entry : tables_) {
        names.push_back(entry.first);
    }
    return names;
}

void MockQuerySource::AddTable(const std::string& name, Table table) {
    tables_[ToLower(name)] = std::move(table);
}

QueryResult MockQuerySource::ShowTables() const {
    QueryResult result;
    result.columns = {"table_name"};
    for (const auto& name : ListTables()) {
        result.rows.push_back(Row{name});
    }
    result.row_count = result.rows.size();
    return result;
}

QueryResult MockQuerySource::Select(const Query& query, const CancellationToken& token) const {
    auto it = tables_.find(ToLower(query.table));
    if (it == tables_.end()) {
        throw QueryError(QueryErrorCode::UNSUPPORTED_QUERY, "unsupported query: " + query.ToString());
    }
    const Table& table = it->second;

    // Resolve filter columns up front
    std::vector<int> column_index;
    column_index.reserve(query.filters.size());
    for (const auto& filter : query.filters) {
        auto col = std::find(table.columns.begin(), table.columns.end(), filter.column);
        if (col == table.columns.end()) {
            throw QueryError(QueryErrorCode::UNSUPPORTED_QUERY,
                             "unsupported query: unknown column '" + filter.column + "'");
        }
        column_index.push_back(static_cast<int>(col - table.columns.begin()));
    }

    QueryResult result;
    result.columns = table.columns;
    result.rows.reserve(table.rows.size());

    for (const auto& row : table.rows) {
        if (token.IsCancelled()) {
            ThrowCancelled(token);
        }
        if (Matches(row, column_index, query.filters)) {
            result.rows.push_back(row);
        }
    }

    result.row_count = result.rows.size();
    return result;
}

bool MockQuerySource::Matches(const Row& row, const std::vector<int>& column_index,
                              const std::vector<Filter>& filters) {
    for (size_t i = 0; i < filters.size(); ++i) {
        const Value& cell = row[column_index[i]];
        const Filter& filter = filters[i];

        switch (filter.op) {
            case FilterOp::EQ:
                if (!ValueEquals(cell, filter.value)) return false;
                break;
            case FilterOp::GE:
                if (!cell.is_number() || !filter.value.is_number()) {
                    throw QueryError(QueryErrorCode::UNSUPPORTED_QUERY,
                                     "unsupported query: '" + filter.column + "' is not numeric");
                }
                if (cell.get<double>() < filter.value.get<double>()) return false;
                break;
        }
    }
    return true;
}

void MockQuerySource::ThrowCancelled(const CancellationToken& token) {
    if (token.Reason() == CancelReason::DEADLINE_EXCEEDED) {
        throw QueryError(QueryErrorCode::DEADLINE_EXCEEDED, "Query timed out");
    }
    throw QueryError(QueryErrorCode::CANCELLED, "Query cancelled");
}

//===----------------------------------------------------------------------===//
// Catalog data
//===----------------------------------------------------------------------===//

MockQuerySource::Table MockQuerySource::AlbumsTable() {
    Table t;
    t.columns = {"id", "title", "release_year", "era", "sales_millions", "genre"};
    t.rows = {
        {"ALB001", "Taylor Swift", 2006, "Country", 5, "Country"},
        {"ALB002", "Fearless", 2008, "Country", 12, "Country Pop"},
        {"ALB003", "Speak Now", 2010, "Country Pop", 6, "Country Pop"},
        {"ALB004", "Red", 2012, "Country Pop", 7, "Pop Rock"},
        {"ALB005", "1989", 2014, "Pop", 10, "Synth Pop"},
        {"ALB006", "Reputation", 2017, "Pop", 4, "Electropop"},
        {"ALB007", "Lover", 2019, "Pop", 3, "Pop"},
        {"ALB008", "Folklore", 2020, "Indie Folk", 3, "Indie Folk"},
        {"ALB009", "Evermore", 2020, "Indie Folk", 2, "Alternative"},
        {"ALB010", "Midnights", 2022, "Synth Pop", 6, "Synth Pop"},
        {"ALB011", "The Tortured Poets Department", 2024, "Alternative", 4, "Alternative Pop"},
    };
    return t;
}

MockQuerySource::Table MockQuerySource::SongsTable() {
    Table t;
    t.columns = {"id", "album_id", "title", "duration_seconds", "streams_millions",
                 "chart_peak", "grammy_nominations"};
    t.rows = {
        {"SONG001", "ALB002", "Love Story", 236, 1800, 4, 0},
        {"SONG002", "ALB002", "You Belong With Me", 232, 1500, 2, 1},
        {"SONG003", "ALB004", "We Are Never Getting Back Together", 193, 1200, 1, 0},
        {"SONG004", "ALB004", "I Knew You Were Trouble", 219, 1400, 2, 1},
        {"SONG005", "ALB005", "Shake It Off", 219, 3200, 1, 3},
        {"SONG006", "ALB005", "Blank Space", 231, 3000, 1, 2},
        {"SONG007", "ALB005", "Style", 231, 1100, 6, 0},
        {"SONG008", "ALB006", "Look What You Made Me Do", 211, 1600, 1, 0},
        {"SONG009", "ALB007", "ME!", 193, 900, 2, 0},
        {"SONG010", "ALB008", "Cardigan", 239, 800, 1, 1},
        {"SONG011", "ALB008", "Exile", 284, 700, 6, 1},
        {"SONG012", "ALB009", "Willow", 214, 600, 1, 0},
        {"SONG013", "ALB010", "Anti-Hero", 200, 2100, 1, 6},
        {"SONG014", "ALB010", "Lavender Haze", 202, 900, 2, 0},
        {"SONG015", "ALB011", "Fortnight", 228, 1100, 1, 0},
        {"SONG016", "ALB005", "Bad Blood", 211, 800, 1, 1},
        {"SONG017", "ALB005", "Wildest Dreams", 220, 1300, 5, 0},
        {"SONG018", "ALB006", "Delicate", 232, 750, 12, 0},
        {"SONG019", "ALB007", "Lover", 221, 850, 10, 0},
        {"SONG020", "ALB008", "The 1", 210, 500, 27, 0},
    };
    return t;
}

MockQuerySource::Table MockQuerySource::ToursTable() {
    Table t;
    t.columns = {"id", "name", "year", "shows", "attendance", "revenue_millions"};
    t.rows = {
        {"TOUR001", "Fearless Tour", 2009, 118, 1200000, 63.5},
        {"TOUR002", "Speak Now World Tour", 2011, 111, 1600000, 123.0},
        {"TOUR003", "The Red Tour", 2013, 86, 1700000, 150.2},
        {"TOUR004", "The 1989 World Tour", 2015, 85, 2278647, 250.7},
        {"TOUR005", "Reputation Stadium Tour", 2018, 53, 2888892, 345.7},
        {"TOUR006", "The Eras Tour", 2023, 152, 10000000, 2000.0},
    };
    return t;
}

} // namespace mcpd_server
