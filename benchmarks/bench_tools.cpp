//===----------------------------------------------------------------------===//
//                         MCPD Server - Benchmarks
//
// benchmarks/bench_tools.cpp
//
// In-process tool execution benchmark (no network)
//===----------------------------------------------------------------------===//

#include "benchmark_common.hpp"
#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include "metrics/metrics.hpp"
#include "query/mock_query_source.hpp"
#include "tools/tool_executor.hpp"
#include "tools/tool_registry.hpp"

#include <cstdlib>
#include <cstring>

using namespace mcpd::bench;
using namespace mcpd_server;

struct ToolBenchConfig {
    size_t iterations = 20;
    uint32_t latency_ms = DEFAULT_QUERY_LATENCY_MS;
    uint32_t batch_delay_ms = DEFAULT_STREAM_BATCH_DELAY_MS;
    bool json_output = false;
};

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --iterations <n>     Operations per benchmark (default: 20)\n"
              << "  --latency <ms>       Simulated query latency (default: 50)\n"
              << "  --batch-delay <ms>   Delay between streamed batches (default: 20)\n"
              << "  --json               Print one JSON object per benchmark\n";
}

static ToolBenchConfig ParseArgs(int argc, char* argv[]) {
    ToolBenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--iterations" && has_value) {
            config.iterations = std::strtoul(argv[++i], nullptr, 10);
        } else if (arg == "--latency" && has_value) {
            config.latency_ms = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--batch-delay" && has_value) {
            config.batch_delay_ms = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--json") {
            config.json_output = true;
        } else {
            PrintUsage(argv[0]);
            std::exit(arg == "--help" ? 0 : 1);
        }
    }
    if (config.iterations == 0) {
        config.iterations = 1;
    }
    return config;
}

static void Report(const BenchmarkResult& result, const ToolBenchConfig& config) {
    if (config.json_output) {
        result.PrintJson();
    } else {
        result.Print();
    }
}

int main(int argc, char* argv[]) {
    ToolBenchConfig config = ParseArgs(argc, argv);
    mcpd::Logger::Initialize("", "warn");

    MockQuerySource::Options source_options;
    source_options.latency = std::chrono::milliseconds(config.latency_ms);
    source_options.batch_delay = std::chrono::milliseconds(config.batch_delay_ms);

    // Large enough that the widest fan-out runs fully in parallel
    auto pool = std::make_shared<ExecutorPool>(100);
    pool->Start();

    auto metrics = std::make_shared<Metrics>();
    ToolExecutor executor(BuildDefaultRegistry(), std::make_shared<MockQuerySource>(source_options),
                          metrics, pool);

    if (!config.json_output) {
        std::cout << "Tool benchmarks: " << config.iterations << " iterations, "
                  << config.latency_ms << "ms simulated latency\n\n";
    }

    ToolInvocation albums{tool_names::QUERY_ALBUMS, nlohmann::json::object()};
    Report(RunBenchmark("single_query", 1, config.iterations, [&]() {
        return !executor.Invoke(albums).is_error;
    }), config);

    ToolInvocation songs{tool_names::QUERY_SONGS, nlohmann::json::object()};
    for (size_t concurrency : {10, 50, 100}) {
        std::vector<ToolInvocation> fan_out(concurrency, songs);
        Report(RunBenchmark("concurrent_queries/" + std::to_string(concurrency), 1,
                            config.iterations, [&]() {
            auto outcomes = executor.InvokeConcurrently(
                fan_out, std::chrono::milliseconds(DEFAULT_CALL_TIMEOUT_MS));
            return std::none_of(outcomes.begin(), outcomes.end(),
                                [](const ToolOutcome& o) { return o.is_error; });
        }), config);
    }

    ToolInvocation stream{tool_names::STREAMING_QUERY, {{"table", "songs"}}};
    Report(RunBenchmark("streaming_query", 1, config.iterations, [&]() {
        return !executor.Invoke(stream).is_error;
    }), config);

    const ToolRegistry& registry = executor.GetRegistry();
    Report(RunBenchmark("list_tools", 1, config.iterations * 1000, [&]() {
        return registry.ToJson().contains("tools");
    }), config);

    pool->Stop();

    if (!config.json_output) {
        auto snapshot = metrics->Snapshot();
        std::cout << "\n" << snapshot.completed << " tool calls, average "
                  << snapshot.avg_latency_ms << " ms\n";
    }

    mcpd::Logger::Shutdown();
    return 0;
}
