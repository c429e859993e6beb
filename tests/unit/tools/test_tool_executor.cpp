//===----------------------------------------------------------------------===//
//                         MCPD Server - Unit Tests
//
// tests/unit/tools/test_tool_executor.cpp
//
// Unit tests for ToolExecutor
//===----------------------------------------------------------------------===//

#include "tools/tool_executor.hpp"
#include "executor/executor_pool.hpp"
#include "metrics/metrics.hpp"
#include "query/mock_query_source.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>

using namespace mcpd_server;
using nlohmann::json;
using std::chrono::milliseconds;

struct Fixture {
    std::shared_ptr<Metrics> metrics = std::make_shared<Metrics>();
    std::shared_ptr<ExecutorPool> pool;
    std::unique_ptr<ToolExecutor> executor;

    explicit Fixture(milliseconds latency = milliseconds(1), size_t pool_threads = 0) {
        MockQuerySource::Options options;
        options.latency = latency;
        options.batch_delay = milliseconds(1);

        if (pool_threads > 0) {
            pool = std::make_shared<ExecutorPool>(pool_threads);
            pool->Start();
        }
        executor = std::make_unique<ToolExecutor>(BuildDefaultRegistry(),
                                                  std::make_shared<MockQuerySource>(options),
                                                  metrics, pool);
    }

    ~Fixture() {
        if (pool) {
            pool->Stop();
        }
    }

    ToolOutcome Call(const std::string& name, json args = json::object()) {
        ToolInvocation invocation;
        invocation.name = name;
        invocation.arguments = std::move(args);
        return executor->Invoke(invocation);
    }
};

//===----------------------------------------------------------------------===//
// Tool Handlers
//===----------------------------------------------------------------------===//

void TestListTables() {
    std::cout << "  Testing list_tables..." << std::endl;

    Fixture f;
    auto outcome = f.Call("list_tables");
    assert(!outcome.is_error);
    assert(outcome.payload["columns"] == json::array({"table_name"}));
    assert(outcome.payload["row_count"] == 3);
    assert(outcome.payload["rows"][0][0] == "albums");

    std::cout << "    PASSED" << std::endl;
}

void TestQueryAlbums() {
    std::cout << "  Testing query_albums..." << std::endl;

    Fixture f;
    auto all = f.Call("query_albums");
    assert(!all.is_error);
    assert(all.payload["row_count"] == 11);
    assert(all.payload["columns"].size() == 6);
    assert(all.payload["rows"].size() == 11);
    assert(all.payload.contains("query_time_ms"));

    auto pop = f.Call("query_albums", {{"era", "Pop"}});
    assert(!pop.is_error);
    assert(pop.payload["row_count"] == 3);

    // null behaves like an omitted argument
    auto unfiltered = f.Call("query_albums", {{"era", nullptr}});
    assert(!unfiltered.is_error);
    assert(unfiltered.payload["row_count"] == 11);

    std::cout << "    PASSED" << std::endl;
}

void TestQuerySongs() {
    std::cout << "  Testing query_songs..." << std::endl;

    Fixture f;
    assert(f.Call("query_songs").payload["row_count"] == 20);
    assert(f.Call("query_songs", {{"album_id", "ALB005"}}).payload["row_count"] == 5);
    assert(f.Call("query_songs", {{"min_streams", 2000}}).payload["row_count"] == 3);
    assert(f.Call("query_songs", {{"min_streams", 1500.5}}).payload["row_count"] == 5);
    assert(f.Call("query_songs", {{"album_id", "ALB005"}, {"min_streams", 2000}})
               .payload["row_count"] == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestAnalyzeTours() {
    std::cout << "  Testing analyze_tours summary..." << std::endl;

    Fixture f;
    auto outcome = f.Call("analyze_tours");
    assert(!outcome.is_error);
    assert(outcome.payload["row_count"] == 6);

    const json& summary = outcome.payload["summary"];
    assert(summary["tour_count"] == 6);
    assert(summary["total_shows"] == 605);
    assert(summary["total_attendance"] == 19667539);
    assert(std::fabs(summary["total_revenue_millions"].get<double>() - 2933.1) < 1e-6);
    assert(std::fabs(summary["revenue_per_show_millions"].get<double>() - 2933.1 / 605) < 1e-6);
    assert(summary["top_tour"] == "The Eras Tour");

    std::cout << "    PASSED" << std::endl;
}

void TestStreamingQuery() {
    std::cout << "  Testing streaming_query..." << std::endl;

    Fixture f;
    std::vector<uint64_t> sequences;
    size_t rows_seen = 0;

    ToolInvocation invocation;
    invocation.name = "streaming_query";
    invocation.arguments = {{"table", "songs"}, {"batch_size", 5}};
    auto outcome = f.executor->Invoke(invocation, CancellationToken(),
        [&](const std::string& tool, const StreamBatch& batch) {
            assert(tool == "streaming_query");
            sequences.push_back(batch.sequence);
            rows_seen += batch.rows.size();
        });

    assert(!outcome.is_error);
    assert(outcome.payload["batches"] == 4);
    assert(outcome.payload["total_rows"] == 20);
    assert(outcome.payload.contains("query_time_ms"));
    assert((sequences == std::vector<uint64_t>{0, 1, 2, 3}));
    assert(rows_seen == 20);

    // Default batch size applies when omitted
    auto defaults = f.Call("streaming_query", {{"table", "albums"}});
    assert(!defaults.is_error);
    assert(defaults.payload["batches"] == 3);
    assert(defaults.payload["total_rows"] == 11);

    // Whole-valued float is accepted as an integer
    auto as_float = f.Call("streaming_query", {{"table", "tours"}, {"batch_size", 4.0}});
    assert(!as_float.is_error);
    assert(as_float.payload["batches"] == 2);

    auto unknown_table = f.Call("streaming_query", {{"table", "setlists"}});
    assert(unknown_table.is_error);
    assert(unknown_table.error_code == ErrorCode::INTERNAL_ERROR);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Errors
//===----------------------------------------------------------------------===//

void TestUnknownTool() {
    std::cout << "  Testing unknown tool..." << std::endl;

    Fixture f;
    auto outcome = f.Call("drop_tables");
    assert(outcome.is_error);
    assert(outcome.error_code == ErrorCode::INTERNAL_ERROR);
    assert(outcome.message == "Unknown tool: drop_tables");

    std::cout << "    PASSED" << std::endl;
}

void TestArgumentValidation() {
    std::cout << "  Testing argument validation..." << std::endl;

    Fixture f;

    auto missing = f.Call("streaming_query");
    assert(missing.is_error);
    assert(missing.error_code == ErrorCode::INVALID_PARAMS);
    assert(missing.message == "missing required argument: table");

    auto wrong_type = f.Call("query_albums", {{"era", 1989}});
    assert(wrong_type.error_code == ErrorCode::INVALID_PARAMS);
    assert(wrong_type.message == "argument 'era' must be string");

    auto extra = f.Call("list_tables", {{"verbose", true}});
    assert(extra.error_code == ErrorCode::INVALID_PARAMS);
    assert(extra.message == "unknown argument: verbose");

    auto zero = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", 0}});
    assert(zero.error_code == ErrorCode::INVALID_PARAMS);
    assert(zero.message == "batch_size must be at least 1");

    auto fractional = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", 2.5}});
    assert(fractional.error_code == ErrorCode::INVALID_PARAMS);

    auto not_object = f.Call("query_albums", json::array({"Pop"}));
    assert(not_object.error_code == ErrorCode::INVALID_PARAMS);

    std::cout << "    PASSED" << std::endl;
}

void TestBatchSizeLimits() {
    std::cout << "  Testing batch_size extremes..." << std::endl;

    Fixture f;

    auto largest = f.Call("streaming_query",
                          {{"table", "songs"}, {"batch_size", std::numeric_limits<uint64_t>::max()}});
    assert(!largest.is_error);
    assert(largest.payload["batches"] == 1);
    assert(largest.payload["total_rows"] == 20);

    auto huge_float = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", 1e300}});
    assert(!huge_float.is_error);
    assert(huge_float.payload["batches"] == 1);

    auto larger_than_table = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", 25}});
    assert(!larger_than_table.is_error);
    assert(larger_than_table.payload["batches"] == 1);

    auto negative = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", -3}});
    assert(negative.is_error);
    assert(negative.error_code == ErrorCode::INVALID_PARAMS);
    assert(negative.message == "batch_size must be at least 1");

    auto lowest = f.Call("streaming_query",
                         {{"table", "songs"}, {"batch_size", std::numeric_limits<int64_t>::min()}});
    assert(lowest.error_code == ErrorCode::INVALID_PARAMS);
    assert(lowest.message == "batch_size must be at least 1");

    auto negative_float = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", -1e300}});
    assert(negative_float.error_code == ErrorCode::INVALID_PARAMS);
    assert(negative_float.message == "batch_size must be at least 1");

    auto zero_float = f.Call("streaming_query", {{"table", "songs"}, {"batch_size", 0.0}});
    assert(zero_float.message == "batch_size must be at least 1");

    std::cout << "    PASSED" << std::endl;
}

void TestCancelledInvocation() {
    std::cout << "  Testing cancelled and timed-out invocations..." << std::endl;

    Fixture f(milliseconds(500));

    CancellationSource cancelled;
    cancelled.Cancel();
    ToolInvocation invocation;
    invocation.name = "query_albums";
    auto outcome = f.executor->Invoke(invocation, cancelled.Token());
    assert(outcome.is_error);
    assert(outcome.error_code == ErrorCode::INTERNAL_ERROR);
    assert(outcome.message == "Query cancelled");

    CancellationSource deadline(milliseconds(10));
    outcome = f.executor->Invoke(invocation, deadline.Token());
    assert(outcome.is_error);
    assert(outcome.message == "Query timed out");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Metrics
//===----------------------------------------------------------------------===//

void TestMetricsCountEveryInvocation() {
    std::cout << "  Testing every invocation is counted once..." << std::endl;

    Fixture f;
    const int successes = 4;
    const int failures = 3;

    for (int i = 0; i < successes; ++i) {
        assert(!f.Call("list_tables").is_error);
    }
    assert(f.Call("unknown").is_error);
    assert(f.Call("query_albums", {{"era", 1}}).is_error);
    assert(f.Call("streaming_query", {{"table", "nope"}}).is_error);

    auto snapshot = f.metrics->Snapshot();
    assert(snapshot.completed == static_cast<uint64_t>(successes + failures));
    assert(snapshot.avg_latency_ms > 0.0);

    std::cout << "    PASSED" << std::endl;
}

void TestFastFailuresStillHaveLatency() {
    std::cout << "  Testing failure-only invocations report a non-zero average..." << std::endl;

    Fixture f;
    for (int i = 0; i < 5; ++i) {
        assert(f.Call("no_such_tool").is_error);
    }
    assert(f.Call("query_albums", {{"era", 1}}).is_error);

    auto snapshot = f.metrics->Snapshot();
    assert(snapshot.completed == 6);
    assert(snapshot.avg_latency_ms > 0.0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Concurrent Invocation
//===----------------------------------------------------------------------===//

void TestInvokeConcurrentlyKeepsOrder() {
    std::cout << "  Testing InvokeConcurrently keeps input order..." << std::endl;

    Fixture f(milliseconds(50), 4);

    std::vector<ToolInvocation> invocations = {
        {"query_songs", json::object()},
        {"query_albums", {{"era", "Pop"}}},
        {"mystery", json::object()},
        {"list_tables", json::object()},
        {"analyze_tours", json::object()},
    };

    auto start = Clock::now();
    auto outcomes = f.executor->InvokeConcurrently(invocations, milliseconds(5000));
    auto elapsed = Clock::now() - start;

    assert(outcomes.size() == 5);
    assert(outcomes[0].payload["row_count"] == 20);
    assert(outcomes[1].payload["row_count"] == 3);
    assert(outcomes[2].is_error && outcomes[2].message == "Unknown tool: mystery");
    assert(outcomes[3].payload["row_count"] == 3);
    assert(outcomes[4].payload.contains("summary"));

    // Four 50ms queries across four workers overlap
    assert(elapsed < milliseconds(180));
    assert(f.metrics->CompletedCount() == 5);

    std::cout << "    PASSED" << std::endl;
}

void TestInvokeConcurrentlyPerItemTimeout() {
    std::cout << "  Testing InvokeConcurrently per-item timeout..." << std::endl;

    Fixture f(milliseconds(300), 4);
    std::vector<ToolInvocation> invocations(3, ToolInvocation{"list_tables", json::object()});

    auto start = Clock::now();
    auto outcomes = f.executor->InvokeConcurrently(invocations, milliseconds(20));
    assert(Clock::now() - start < milliseconds(250));

    for (const auto& outcome : outcomes) {
        assert(outcome.is_error);
        assert(outcome.message == "Query timed out");
    }

    std::cout << "    PASSED" << std::endl;
}

void TestInvokeConcurrentlyWithoutPool() {
    std::cout << "  Testing InvokeConcurrently without a pool runs serially..." << std::endl;

    Fixture f;
    std::vector<ToolInvocation> invocations = {
        {"list_tables", json::object()},
        {"query_albums", json::object()},
    };

    auto outcomes = f.executor->InvokeConcurrently(invocations, milliseconds(1000));
    assert(outcomes.size() == 2);
    assert(outcomes[0].payload["row_count"] == 3);
    assert(outcomes[1].payload["row_count"] == 11);

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== ToolExecutor Unit Tests ===" << std::endl;

    std::cout << "\n1. Tool Handlers:" << std::endl;
    TestListTables();
    TestQueryAlbums();
    TestQuerySongs();
    TestAnalyzeTours();
    TestStreamingQuery();

    std::cout << "\n2. Errors:" << std::endl;
    TestUnknownTool();
    TestArgumentValidation();
    TestBatchSizeLimits();
    TestCancelledInvocation();

    std::cout << "\n3. Metrics:" << std::endl;
    TestMetricsCountEveryInvocation();
    TestFastFailuresStillHaveLatency();

    std::cout << "\n4. Concurrent Invocation:" << std::endl;
    TestInvokeConcurrentlyKeepsOrder();
    TestInvokeConcurrentlyPerItemTimeout();
    TestInvokeConcurrentlyWithoutPool();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
