//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// executor/cancellation.cpp
//
// Cooperative cancellation implementation
//===----------------------------------------------------------------------===//

#include "executor/cancellation.hpp"
#include <algorithm>
#include <utility>

namespace mcpd_server {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<uint8_t> reason{static_cast<uint8_t>(CancelReason::NONE)};
    TimePoint deadline = TimePoint::max();

    uint64_t next_callback_id = 1;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;

    bool Fired() const {
        if (reason.load(std::memory_order_acquire) != static_cast<uint8_t>(CancelReason::NONE)) {
            return true;
        }
        return deadline != TimePoint::max() && Clock::now() >= deadline;
    }

    bool Fire(CancelReason why) {
        std::vector<std::pair<uint64_t, std::function<void()>>> to_run;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (reason.load(std::memory_order_relaxed) != static_cast<uint8_t>(CancelReason::NONE)) {
                return false;
            }
            reason.store(static_cast<uint8_t>(why), std::memory_order_release);
            to_run.swap(callbacks);
        }
        cv.notify_all();

        // Callbacks run outside the lock so they may touch other tokens
        for (auto& entry : to_run) {
            entry.second();
        }
        return true;
    }
};

} // namespace detail

const char* CancelReasonToString(CancelReason reason) {
    switch (reason) {
        case CancelReason::NONE: return "none";
        case CancelReason::CANCELLED: return "cancelled";
        case CancelReason::DEADLINE_EXCEEDED: return "deadline exceeded";
        default: return "unknown";
    }
}

//===----------------------------------------------------------------------===//
// CancellationToken
//===----------------------------------------------------------------------===//

bool CancellationToken::IsCancelled() const {
    return state_ && state_->Fired();
}

CancelReason CancellationToken::Reason() const {
    if (!state_) {
        return CancelReason::NONE;
    }
    auto reason = static_cast<CancelReason>(state_->reason.load(std::memory_order_acquire));
    if (reason != CancelReason::NONE) {
        return reason;
    }
    if (state_->deadline != TimePoint::max() && Clock::now() >= state_->deadline) {
        return CancelReason::DEADLINE_EXCEEDED;
    }
    return CancelReason::NONE;
}

TimePoint CancellationToken::Deadline() const {
    return state_ ? state_->deadline : TimePoint::max();
}

bool CancellationToken::WaitFor(Duration duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }

    auto wake_at = std::min(Clock::now() + duration, state_->deadline);
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, wake_at, [this]() {
        return state_->reason.load(std::memory_order_acquire) !=
               static_cast<uint8_t>(CancelReason::NONE);
    });
    lock.unlock();

    return IsCancelled();
}

CancellationRegistration CancellationToken::OnCancel(std::function<void()> callback) const {
    if (!state_) {
        return CancellationRegistration();
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->reason.load(std::memory_order_relaxed) == static_cast<uint8_t>(CancelReason::NONE)) {
            uint64_t id = state_->next_callback_id++;
            state_->callbacks.emplace_back(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }

    // Already cancelled
    callback();
    return CancellationRegistration();
}

//===----------------------------------------------------------------------===//
// CancellationRegistration
//===----------------------------------------------------------------------===//

CancellationRegistration::~CancellationRegistration() {
    Reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_))
    , id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::Reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto& callbacks = state->callbacks;
        callbacks.erase(std::remove_if(callbacks.begin(), callbacks.end(),
                                       [this](const auto& entry) { return entry.first == id_; }),
                        callbacks.end());
    }
    state_.reset();
    id_ = 0;
}

//===----------------------------------------------------------------------===//
// CancellationSource
//===----------------------------------------------------------------------===//

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

CancellationSource::CancellationSource(std::chrono::milliseconds timeout)
    : state_(std::make_shared<detail::CancellationState>()) {
    state_->deadline = Clock::now() + timeout;
}

CancellationSource::CancellationSource(const CancellationToken& parent,
                                       std::chrono::milliseconds timeout)
    : state_(std::make_shared<detail::CancellationState>()) {
    state_->deadline = std::min(parent.Deadline(), Clock::now() + timeout);

    std::weak_ptr<detail::CancellationState> weak = state_;
    parent_registration_ = parent.OnCancel([weak]() {
        if (auto state = weak.lock()) {
            state->Fire(CancelReason::CANCELLED);
        }
    });
}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancellationState>()) {
    state_->deadline = parent.Deadline();

    std::weak_ptr<detail::CancellationState> weak = state_;
    parent_registration_ = parent.OnCancel([weak]() {
        if (auto state = weak.lock()) {
            state->Fire(CancelReason::CANCELLED);
        }
    });
}

CancellationSource::~CancellationSource() {
    parent_registration_.Reset();
}

bool CancellationSource::Cancel(CancelReason reason) {
    if (reason == CancelReason::NONE) {
        reason = CancelReason::CANCELLED;
    }
    return state_->Fire(reason);
}

} // namespace mcpd_server
