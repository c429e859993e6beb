//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// network/io_context_pool.cpp
//
// IO context thread pool implementation
//===----------------------------------------------------------------------===//

#include "network/io_context_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace mcpd_server {

IoContextPool::Lease::Lease(asio::io_context& context, std::shared_ptr<std::atomic<size_t>> load)
    : context_(&context)
    , load_(std::move(load)) {
    load_->fetch_add(1, std::memory_order_relaxed);
}

IoContextPool::Lease::~Lease() {
    if (load_) {
        load_->fetch_sub(1, std::memory_order_relaxed);
    }
}

IoContextPool::IoContextPool(size_t pool_size)
    : next_start_(0)
    , running_(false) {
    if (pool_size == 0) {
        pool_size = std::max(1u, std::thread::hardware_concurrency());
    }

    slots_.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        Slot slot;
        slot.context = std::make_unique<asio::io_context>(1);
        slot.load = std::make_shared<std::atomic<size_t>>(0);
        slots_.push_back(std::move(slot));
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

void IoContextPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    for (auto& slot : slots_) {
        slot.context->restart();
        work_guards_.push_back(asio::make_work_guard(*slot.context));

        asio::io_context* context = slot.context.get();
        threads_.emplace_back([context]() {
            try {
                context->run();
            } catch (const std::exception& e) {
                LOG_ERROR("io_pool", "IO thread terminated: " + std::string(e.what()));
            }
        });
    }

    LOG_INFO("io_pool", "Started " + std::to_string(threads_.size()) + " IO threads");
}

void IoContextPool::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    work_guards_.clear();
    for (auto& slot : slots_) {
        slot.context->stop();
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOG_INFO("io_pool", "IO threads stopped");
}

IoContextPool::Lease IoContextPool::Acquire() {
    const size_t n = slots_.size();
    const size_t start = next_start_.fetch_add(1, std::memory_order_relaxed) % n;

    size_t best = start;
    size_t best_load = slots_[start].load->load(std::memory_order_relaxed);
    for (size_t step = 1; step < n && best_load > 0; ++step) {
        size_t i = (start + step) % n;
        size_t load = slots_[i].load->load(std::memory_order_relaxed);
        if (load < best_load) {
            best = i;
            best_load = load;
        }
    }

    LOG_TRACE("io_pool", "Assigned context " + std::to_string(best) +
              " (" + std::to_string(best_load) + " live)");
    return Lease(*slots_[best].context, slots_[best].load);
}

std::vector<size_t> IoContextPool::GetLoad() const {
    std::vector<size_t> load;
    load.reserve(slots_.size());
    for (const auto& slot : slots_) {
        load.push_back(slot.load->load(std::memory_order_relaxed));
    }
    return load;
}

} // namespace mcpd_server
