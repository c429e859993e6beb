//===----------------------------------------------------------------------===//
//                         MCPD Server - Benchmarks
//
// benchmarks/benchmark_common.hpp
//
// Timing and latency statistics for the benchmark programs
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpd::bench {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::nanoseconds;

inline double ToMilliseconds(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

inline double ToSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

//===----------------------------------------------------------------------===//
// Statistics
//===----------------------------------------------------------------------===//

// Thread-safe latency samples, in milliseconds
class LatencyStats {
public:
    void Record(Duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.push_back(ToMilliseconds(d));
    }

    size_t Count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_.size();
    }

    double Mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (samples_.empty()) return 0;
        return std::accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
    }

    double Min() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_.empty() ? 0 : *std::min_element(samples_.begin(), samples_.end());
    }

    double Max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_.empty() ? 0 : *std::max_element(samples_.begin(), samples_.end());
    }

    double Percentile(double p) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (samples_.empty()) return 0;
        std::vector<double> sorted = samples_;
        std::sort(sorted.begin(), sorted.end());
        return sorted[static_cast<size_t>(p / 100.0 * (sorted.size() - 1))];
    }

    nlohmann::json ToJson() const {
        return {
            {"count", Count()},
            {"min_ms", Min()},
            {"max_ms", Max()},
            {"mean_ms", Mean()},
            {"p50_ms", Percentile(50)},
            {"p95_ms", Percentile(95)},
            {"p99_ms", Percentile(99)}
        };
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> samples_;
};

//===----------------------------------------------------------------------===//
// Benchmark Results
//===----------------------------------------------------------------------===//

struct BenchmarkResult {
    std::string name;
    size_t total_operations = 0;
    size_t failed_operations = 0;
    Duration total_time{0};
    std::unique_ptr<LatencyStats> latency = std::make_unique<LatencyStats>();

    double OperationsPerSecond() const {
        double secs = ToSeconds(total_time);
        return secs > 0 ? (total_operations - failed_operations) / secs : 0;
    }

    void Print() const {
        std::cout << std::fixed << std::setprecision(2)
                  << std::left << std::setw(28) << name
                  << std::right << std::setw(8) << total_operations << " ops"
                  << std::setw(10) << OperationsPerSecond() << " ops/s"
                  << "   mean " << latency->Mean() << " ms"
                  << "   p99 " << latency->Percentile(99) << " ms";
        if (failed_operations > 0) {
            std::cout << "   (" << failed_operations << " failed)";
        }
        std::cout << "\n";
    }

    void PrintJson() const {
        nlohmann::json out = {
            {"benchmark", name},
            {"total_operations", total_operations},
            {"failed_operations", failed_operations},
            {"total_time_s", ToSeconds(total_time)},
            {"throughput_ops_sec", OperationsPerSecond()},
            {"latency", latency->ToJson()}
        };
        std::cout << out.dump() << "\n";
    }
};

// Run `op` `iterations` times on each of `threads` threads. `op` returns
// false on failure.
template <typename Operation>
BenchmarkResult RunBenchmark(const std::string& name, size_t threads, size_t iterations,
                             Operation op) {
    BenchmarkResult result;
    result.name = name;

    std::atomic<size_t> failed{0};
    auto start = Clock::now();

    std::vector<std::thread> workers;
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            for (size_t i = 0; i < iterations; ++i) {
                auto op_start = Clock::now();
                bool ok = op();
                result.latency->Record(Clock::now() - op_start);
                if (!ok) {
                    failed++;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    result.total_time = Clock::now() - start;
    result.total_operations = threads * iterations;
    result.failed_operations = failed.load();
    return result;
}

}  // namespace mcpd::bench
