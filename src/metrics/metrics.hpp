//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// metrics/metrics.hpp
//
// Process-wide request counters
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <nlohmann/json.hpp>

namespace mcpd_server {

struct MetricsSnapshot {
    uint64_t completed = 0;
    double avg_latency_ms = 0.0;
    int64_t in_flight = 0;
    int64_t uptime_seconds = 0;

    nlohmann::json ToJson() const;
};

// Shared by every session; lock-free.
// Counters only grow, except in_flight which follows task start/end.
class Metrics {
public:
    Metrics();

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    // Recorded at microsecond resolution; a completion counts as at least 1us
    void RecordCompletion(std::chrono::microseconds elapsed);

    void RecordTaskStart();
    void RecordTaskEnd();

    // Fields are read individually, so a snapshot taken while requests run
    // may mix counts from adjacent instants
    MetricsSnapshot Snapshot() const;

    nlohmann::json ToJson() const { return Snapshot().ToJson(); }

    uint64_t CompletedCount() const { return completed_.load(std::memory_order_relaxed); }
    int64_t InFlight() const { return in_flight_.load(std::memory_order_relaxed); }

    // Tracks one task for the lifetime of the guard
    class InFlightGuard {
    public:
        explicit InFlightGuard(Metrics& metrics) : metrics_(&metrics) {
            metrics_->RecordTaskStart();
        }
        ~InFlightGuard() {
            if (metrics_) {
                metrics_->RecordTaskEnd();
            }
        }

        InFlightGuard(InFlightGuard&& other) noexcept : metrics_(other.metrics_) {
            other.metrics_ = nullptr;
        }

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;
        InFlightGuard& operator=(InFlightGuard&&) = delete;

    private:
        Metrics* metrics_;
    };

private:
    const TimePoint start_time_;

    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> total_latency_us_;
    std::atomic<int64_t> in_flight_;
};

} // namespace mcpd_server
