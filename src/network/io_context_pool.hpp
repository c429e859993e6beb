//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// network/io_context_pool.hpp
//
// Asio IO context thread pool with per-context connection accounting
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>

namespace mcpd_server {

// One io_context per thread. Sessions are long-lived, so a new connection
// goes to the context currently carrying the fewest; all of its handlers
// then run on that context's thread.
class IoContextPool {
public:
    // A connection's place on one context. The count is released when the
    // lease is destroyed; it does not reference the pool itself.
    class Lease {
    public:
        Lease(asio::io_context& context, std::shared_ptr<std::atomic<size_t>> load);
        ~Lease();

        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        asio::io_context& Context() const { return *context_; }

    private:
        asio::io_context* context_;
        std::shared_ptr<std::atomic<size_t>> load_;
    };

    // 0 = one context per hardware thread
    explicit IoContextPool(size_t pool_size = 0);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void Start();
    void Stop();

    // Least-loaded context; ties rotate so an idle pool fills evenly
    Lease Acquire();

    // Live leases per context, in context order
    std::vector<size_t> GetLoad() const;

    size_t Size() const { return slots_.size(); }

    bool IsRunning() const { return running_; }

private:
    struct Slot {
        std::unique_ptr<asio::io_context> context;
        std::shared_ptr<std::atomic<size_t>> load;
    };

    std::vector<Slot> slots_;
    std::vector<asio::executor_work_guard<asio::io_context::executor_type>> work_guards_;
    std::vector<std::thread> threads_;

    std::atomic<size_t> next_start_;
    std::atomic<bool> running_;
};

} // namespace mcpd_server
