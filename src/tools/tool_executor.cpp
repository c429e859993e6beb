//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// tools/tool_executor.cpp
//
// Tool dispatch, argument validation and result shaping
//===----------------------------------------------------------------------===//

#include "tools/tool_executor.hpp"
#include "executor/executor_pool.hpp"
#include "metrics/metrics.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <future>
#include <limits>

namespace mcpd_server {

namespace {

// Treat an explicit null like an omitted argument
const nlohmann::json* FindArgument(const nlohmann::json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

int ColumnIndex(const std::vector<std::string>& columns, const std::string& name) {
    auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) {
        throw QueryError(QueryErrorCode::INTERNAL, "missing column: " + name);
    }
    return static_cast<int>(it - columns.begin());
}

// Integral batch_size as a count, saturating at SIZE_MAX. Zero for values
// below 1.
size_t ReadBatchSize(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        uint64_t n = value.get<uint64_t>();
        return n > std::numeric_limits<size_t>::max() ? std::numeric_limits<size_t>::max()
                                                       : static_cast<size_t>(n);
    }
    if (value.is_number_integer()) {
        int64_t n = value.get<int64_t>();
        return n < 1 ? 0 : static_cast<size_t>(n);
    }
    double v = value.get<double>();
    if (!(v >= 1.0)) {
        return 0;
    }
    if (v >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(v);
}

} // anonymous namespace

ToolOutcome ToolOutcome::Success(nlohmann::json payload) {
    ToolOutcome outcome;
    outcome.payload = std::move(payload);
    return outcome;
}

ToolOutcome ToolOutcome::Failure(ErrorCode code, std::string message) {
    ToolOutcome outcome;
    outcome.is_error = true;
    outcome.error_code = code;
    outcome.message = std::move(message);
    return outcome;
}

ToolExecutor::ToolExecutor(std::shared_ptr<ToolRegistry> registry,
                           std::shared_ptr<QuerySource> source,
                           std::shared_ptr<Metrics> metrics,
                           std::shared_ptr<ExecutorPool> pool,
                           const Options& options)
    : registry_(std::move(registry))
    , source_(std::move(source))
    , metrics_(std::move(metrics))
    , pool_(std::move(pool))
    , options_(options) {
    if (options_.default_batch_size == 0) {
        options_.default_batch_size = DEFAULT_STREAM_BATCH_SIZE;
    }
}

ToolOutcome ToolExecutor::Invoke(const ToolInvocation& invocation,
                                 const CancellationToken& token,
                                 const ProgressCallback& progress) {
    auto start = Clock::now();
    ToolOutcome outcome;

    const ToolDescriptor* tool = registry_->Find(invocation.name);
    if (!tool) {
        LOG_WARN("tool_executor", "Unknown tool: " + invocation.name);
        outcome = ToolOutcome::Failure(ErrorCode::INTERNAL_ERROR, "Unknown tool: " + invocation.name);
    } else {
        LOG_INFO("tool_executor", "Invoking tool " + invocation.name);
        LOG_DEBUG("tool_executor", invocation.name + " arguments: " + invocation.arguments.dump());

        std::string invalid = ValidateArguments(*tool, invocation.arguments);
        if (!invalid.empty()) {
            outcome = ToolOutcome::Failure(ErrorCode::INVALID_PARAMS, invalid);
        } else {
            try {
                outcome = ToolOutcome::Success(Dispatch(invocation, token, progress));
            } catch (const QueryError& e) {
                if (e.IsCancellation()) {
                    LOG_WARN("tool_executor", invocation.name + ": " + e.what());
                } else {
                    LOG_ERROR("tool_executor", invocation.name + " failed: " + e.what());
                }
                outcome = ToolOutcome::Failure(ErrorCode::INTERNAL_ERROR, e.what());
            } catch (const std::exception& e) {
                LOG_ERROR("tool_executor", invocation.name + " failed: " + std::string(e.what()));
                outcome = ToolOutcome::Failure(ErrorCode::INTERNAL_ERROR, "internal error");
            }
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    if (metrics_) {
        metrics_->RecordCompletion(elapsed);
    }

    DLOG_DEBUG("tool_executor", "{} finished in {}us ({})", invocation.name, elapsed.count(),
               outcome.is_error ? "error" : "ok");
    return outcome;
}

std::vector<ToolOutcome> ToolExecutor::InvokeConcurrently(const std::vector<ToolInvocation>& invocations,
                                                          std::chrono::milliseconds per_item_timeout,
                                                          const CancellationToken& token) {
    std::vector<ToolOutcome> outcomes;
    outcomes.reserve(invocations.size());

    auto run_one = [this, per_item_timeout, token](const ToolInvocation& invocation) {
        CancellationSource item_source(token, per_item_timeout);
        return Invoke(invocation, item_source.Token());
    };

    if (!pool_ || !pool_->IsRunning()) {
        for (const auto& invocation : invocations) {
            outcomes.push_back(run_one(invocation));
        }
        return outcomes;
    }

    std::vector<std::future<ToolOutcome>> futures;
    futures.reserve(invocations.size());
    for (const auto& invocation : invocations) {
        futures.push_back(pool_->SubmitWithFuture(run_one, invocation));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            outcomes.push_back(futures[i].get());
        } catch (const std::future_error& e) {
            // The pool stopped before the task ran
            LOG_WARN("tool_executor", "Concurrent invocation of " + invocations[i].name +
                     " dropped: " + std::string(e.what()));
            outcomes.push_back(ToolOutcome::Failure(ErrorCode::INTERNAL_ERROR, "executor unavailable"));
        }
    }
    return outcomes;
}

std::string ToolExecutor::ValidateArguments(const ToolDescriptor& tool,
                                            const nlohmann::json& arguments) const {
    if (arguments.is_null()) {
        for (const auto& arg : tool.arguments) {
            if (arg.required) {
                return "missing required argument: " + arg.name;
            }
        }
        return "";
    }
    if (!arguments.is_object()) {
        return "arguments must be an object";
    }

    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        const ArgumentSpec* arg = tool.FindArgument(it.key());
        if (!arg) {
            return "unknown argument: " + it.key();
        }
        if (it->is_null()) {
            continue;
        }
        if (!ArgumentTypeMatches(arg->type, *it)) {
            return "argument '" + arg->name + "' must be " +
                   std::string(ArgumentTypeToString(arg->type));
        }
    }

    for (const auto& arg : tool.arguments) {
        if (arg.required && !FindArgument(arguments, arg.name.c_str())) {
            return "missing required argument: " + arg.name;
        }
    }

    if (tool.name == tool_names::STREAMING_QUERY) {
        const nlohmann::json* batch_size = FindArgument(arguments, "batch_size");
        if (batch_size && ReadBatchSize(*batch_size) == 0) {
            return "batch_size must be at least 1";
        }
    }
    return "";
}

nlohmann::json ToolExecutor::Dispatch(const ToolInvocation& invocation,
                                      const CancellationToken& token,
                                      const ProgressCallback& progress) {
    static const nlohmann::json empty_args = nlohmann::json::object();
    const nlohmann::json& args = invocation.arguments.is_null() ? empty_args : invocation.arguments;
    const std::string& name = invocation.name;

    if (name == tool_names::LIST_TABLES) {
        return ListTables(token);
    } else if (name == tool_names::QUERY_ALBUMS) {
        return QueryAlbums(args, token);
    } else if (name == tool_names::QUERY_SONGS) {
        return QuerySongs(args, token);
    } else if (name == tool_names::ANALYZE_TOURS) {
        return AnalyzeTours(token);
    } else if (name == tool_names::STREAMING_QUERY) {
        return StreamingQuery(args, token, progress);
    }

    // Registered but without a handler
    throw QueryError(QueryErrorCode::UNSUPPORTED_QUERY, "unsupported query: no handler for tool " + name);
}

nlohmann::json ToolExecutor::ListTables(const CancellationToken& token) {
    return source_->Execute(Query::ShowTables(), token).ToJson();
}

nlohmann::json ToolExecutor::QueryAlbums(const nlohmann::json& args, const CancellationToken& token) {
    std::vector<Filter> filters;
    if (const nlohmann::json* era = FindArgument(args, "era")) {
        filters.push_back({"era", FilterOp::EQ, *era});
    }
    return source_->Execute(Query::Select("albums", std::move(filters)), token).ToJson();
}

nlohmann::json ToolExecutor::QuerySongs(const nlohmann::json& args, const CancellationToken& token) {
    std::vector<Filter> filters;
    if (const nlohmann::json* album_id = FindArgument(args, "album_id")) {
        filters.push_back({"album_id", FilterOp::EQ, *album_id});
    }
    if (const nlohmann::json* min_streams = FindArgument(args, "min_streams")) {
        filters.push_back({"streams_millions", FilterOp::GE, *min_streams});
    }
    return source_->Execute(Query::Select("songs", std::move(filters)), token).ToJson();
}

nlohmann::json ToolExecutor::AnalyzeTours(const CancellationToken& token) {
    QueryResult result = source_->Execute(Query::Select("tours"), token);

    int name_col = ColumnIndex(result.columns, "name");
    int shows_col = ColumnIndex(result.columns, "shows");
    int attendance_col = ColumnIndex(result.columns, "attendance");
    int revenue_col = ColumnIndex(result.columns, "revenue_millions");

    int64_t total_shows = 0;
    int64_t total_attendance = 0;
    double total_revenue = 0.0;
    double top_revenue = -1.0;
    std::string top_tour;

    for (const auto& row : result.rows) {
        total_shows += row[shows_col].get<int64_t>();
        total_attendance += row[attendance_col].get<int64_t>();

        double revenue = row[revenue_col].get<double>();
        total_revenue += revenue;
        if (revenue > top_revenue) {
            top_revenue = revenue;
            top_tour = row[name_col].get<std::string>();
        }
    }

    nlohmann::json summary = {
        {"tour_count", result.row_count},
        {"total_shows", total_shows},
        {"total_attendance", total_attendance},
        {"total_revenue_millions", total_revenue},
        {"revenue_per_show_millions", total_shows > 0 ? total_revenue / static_cast<double>(total_shows) : 0.0},
        {"top_tour", top_tour.empty() ? nlohmann::json() : nlohmann::json(top_tour)}
    };

    nlohmann::json payload = result.ToJson();
    payload["summary"] = std::move(summary);
    return payload;
}

nlohmann::json ToolExecutor::StreamingQuery(const nlohmann::json& args,
                                            const CancellationToken& token,
                                            const ProgressCallback& progress) {
    auto start = Clock::now();
    std::string table = args.at("table").get<std::string>();

    size_t batch_size = options_.default_batch_size;
    if (const nlohmann::json* requested = FindArgument(args, "batch_size")) {
        batch_size = ReadBatchSize(*requested);
    }

    auto stream = source_->ExecuteStreaming(Query::Select(table), batch_size, token);

    uint64_t batches = 0;
    uint64_t total_rows = 0;
    while (auto batch = stream->Next()) {
        batches++;
        total_rows += batch->rows.size();

        DLOG_DEBUG("tool_executor", "streaming_query {}: batch {} with {} rows",
                   table, batch->sequence, batch->rows.size());
        if (progress) {
            progress(tool_names::STREAMING_QUERY, *batch);
        }
    }

    return {
        {"batches", batches},
        {"total_rows", total_rows},
        {"query_time_ms", ElapsedMillis(start)}
    };
}

} // namespace mcpd_server
