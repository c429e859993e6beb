//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// metrics/metrics.cpp
//
// Request counters implementation
//===----------------------------------------------------------------------===//

#include "metrics/metrics.hpp"
#include <algorithm>

namespace mcpd_server {

nlohmann::json MetricsSnapshot::ToJson() const {
    return {
        {"queries_executed", completed},
        {"avg_latency_ms", avg_latency_ms},
        {"active_tasks", in_flight},
        {"uptime_seconds", uptime_seconds}
    };
}

Metrics::Metrics()
    : start_time_(Clock::now())
    , completed_(0)
    , total_latency_us_(0)
    , in_flight_(0) {
}

void Metrics::RecordCompletion(std::chrono::microseconds elapsed) {
    int64_t elapsed_us = std::max<int64_t>(elapsed.count(), 1);
    total_latency_us_.fetch_add(static_cast<uint64_t>(elapsed_us), std::memory_order_relaxed);
    completed_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::RecordTaskStart() {
    in_flight_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::RecordTaskEnd() {
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
}

MetricsSnapshot Metrics::Snapshot() const {
    MetricsSnapshot snapshot;
    snapshot.completed = completed_.load(std::memory_order_relaxed);

    uint64_t total_us = total_latency_us_.load(std::memory_order_relaxed);
    if (snapshot.completed > 0) {
        snapshot.avg_latency_ms = static_cast<double>(total_us) / 1000.0 /
                                  static_cast<double>(snapshot.completed);
    }

    snapshot.in_flight = in_flight_.load(std::memory_order_relaxed);
    snapshot.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        Clock::now() - start_time_).count();
    return snapshot;
}

} // namespace mcpd_server
