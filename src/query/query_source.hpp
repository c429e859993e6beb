//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/query_source.hpp
//
// Row-oriented backend interface
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "executor/cancellation.hpp"
#include "query/batch_stream.hpp"
#include "query/query_types.hpp"

namespace mcpd_server {

class QuerySource {
public:
    virtual ~QuerySource() = default;

    // Run the query to completion.
    // Throws QueryError (UNSUPPORTED_QUERY, CANCELLED, DEADLINE_EXCEEDED).
    virtual QueryResult Execute(const Query& query, const CancellationToken& token) = 0;

    // Start a producer that delivers the result in batches of at most
    // batch_size rows. Failures are reported through BatchStream::Next().
    virtual std::unique_ptr<BatchStream> ExecuteStreaming(const Query& query,
                                                          size_t batch_size,
                                                          const CancellationToken& token) = 0;

    // Names of the tables the backend can answer for
    virtual std::vector<std::string> ListTables() const = 0;
};

} // namespace mcpd_server
