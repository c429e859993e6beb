//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/mock_query_source.hpp
//
// In-memory catalog (albums, songs, tours) with simulated latency
//===----------------------------------------------------------------------===//

#pragma once

#include "query/query_source.hpp"
#include <map>

namespace mcpd_server {

class MockQuerySource : public QuerySource {
public:
    struct Options {
        // Simulated round trip before every query
        std::chrono::milliseconds latency;
        // Pacing delay after each streamed batch
        std::chrono::milliseconds batch_delay;
        // Batches buffered between producer and consumer
        size_t channel_capacity;

        Options()
            : latency(DEFAULT_QUERY_LATENCY_MS)
            , batch_delay(DEFAULT_STREAM_BATCH_DELAY_MS)
            , channel_capacity(DEFAULT_STREAM_CHANNEL_CAPACITY) {}
    };

    struct Table {
        std::vector<std::string> columns;
        std::vector<Row> rows;
    };

    explicit MockQuerySource(const Options& options = Options{});
    ~MockQuerySource() override = default;

    QueryResult Execute(const Query& query, const CancellationToken& token) override;

    // The returned stream must not outlive this source
    std::unique_ptr<BatchStream> ExecuteStreaming(const Query& query,
                                                  size_t batch_size,
                                                  const CancellationToken& token) override;

    std::vector<std::string> ListTables() const override;

    const Options& GetOptions() const { return options_; }

    // Add or replace a table. Not thread-safe: call before serving queries.
    void AddTable(const std::string& name, Table table);

    static Table AlbumsTable();
    static Table SongsTable();
    static Table ToursTable();

private:
    QueryResult Select(const Query& query, const CancellationToken& token) const;
    QueryResult ShowTables() const;

    static bool Matches(const Row& row, const std::vector<int>& column_index,
                        const std::vector<Filter>& filters);

    [[noreturn]] static void ThrowCancelled(const CancellationToken& token);

private:
    Options options_;

    // Read-only once serving starts; ordered for a stable SHOW TABLES
    std::map<std::string, Table> tables_;
};

} // namespace mcpd_server
