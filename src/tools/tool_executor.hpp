//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// tools/tool_executor.hpp
//
// Maps tool invocations onto the query source
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "executor/cancellation.hpp"
#include "protocol/message.hpp"
#include "query/query_source.hpp"
#include "tools/tool_registry.hpp"

namespace mcpd_server {

struct ToolInvocation {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ToolOutcome {
    nlohmann::json payload;
    bool is_error = false;
    ErrorCode error_code = ErrorCode::INTERNAL_ERROR;
    std::string message;

    static ToolOutcome Success(nlohmann::json payload);
    static ToolOutcome Failure(ErrorCode code, std::string message);
};

class ToolExecutor {
public:
    struct Options {
        // Rows per batch when streaming_query omits batch_size
        size_t default_batch_size;

        Options() : default_batch_size(DEFAULT_STREAM_BATCH_SIZE) {}
    };

    // Called once per streamed batch, in sequence order
    using ProgressCallback = std::function<void(const std::string& tool, const StreamBatch& batch)>;

    // `pool` is only used by InvokeConcurrently; without one the items run
    // one after another on the calling thread
    ToolExecutor(std::shared_ptr<ToolRegistry> registry,
                 std::shared_ptr<QuerySource> source,
                 std::shared_ptr<Metrics> metrics,
                 std::shared_ptr<ExecutorPool> pool = nullptr,
                 const Options& options = Options{});

    // Never throws. Records exactly one completion in the metrics.
    ToolOutcome Invoke(const ToolInvocation& invocation,
                       const CancellationToken& token = CancellationToken(),
                       const ProgressCallback& progress = nullptr);

    // Runs every invocation as its own task, each under a deadline of
    // per_item_timeout derived from `token`. Outcomes are in input order.
    // Must not be called from a worker of the same pool.
    std::vector<ToolOutcome> InvokeConcurrently(const std::vector<ToolInvocation>& invocations,
                                                std::chrono::milliseconds per_item_timeout,
                                                const CancellationToken& token = CancellationToken());

    const ToolRegistry& GetRegistry() const { return *registry_; }

private:
    // Empty string when the arguments match the descriptor
    std::string ValidateArguments(const ToolDescriptor& tool, const nlohmann::json& arguments) const;

    // Throws QueryError
    nlohmann::json Dispatch(const ToolInvocation& invocation,
                            const CancellationToken& token,
                            const ProgressCallback& progress);

    nlohmann::json ListTables(const CancellationToken& token);
    nlohmann::json QueryAlbums(const nlohmann::json& args, const CancellationToken& token);
    nlohmann::json QuerySongs(const nlohmann::json& args, const CancellationToken& token);
    nlohmann::json AnalyzeTours(const CancellationToken& token);
    nlohmann::json StreamingQuery(const nlohmann::json& args,
                                  const CancellationToken& token,
                                  const ProgressCallback& progress);

private:
    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<QuerySource> source_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<ExecutorPool> pool_;
    Options options_;
};

} // namespace mcpd_server
