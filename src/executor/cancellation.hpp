//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// executor/cancellation.hpp
//
// Cooperative cancellation with optional deadline
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <vector>

namespace mcpd_server {

enum class CancelReason : uint8_t {
    NONE = 0,
    CANCELLED = 1,
    DEADLINE_EXCEEDED = 2
};

const char* CancelReasonToString(CancelReason reason);

namespace detail {
struct CancellationState;
}

class CancellationRegistration;

// Read side of a cancellation signal. A default constructed token never fires.
// A token fires when its source is cancelled or when its deadline passes;
// deadline expiry is observed by IsCancelled()/WaitFor() without a timer thread.
class CancellationToken {
public:
    CancellationToken() = default;

    bool IsCancelled() const;
    CancelReason Reason() const;

    // TimePoint::max() when there is no deadline
    TimePoint Deadline() const;

    // Sleep for up to `duration`, waking early on cancellation or deadline.
    // Returns true if the token fired.
    bool WaitFor(Duration duration) const;

    // Run `callback` once on explicit cancellation (immediately if already
    // cancelled). Deadline expiry does not invoke callbacks; waiters bound
    // their waits by Deadline() instead.
    CancellationRegistration OnCancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// Unsubscribes its callback on destruction
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void Reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

// Write side of a cancellation signal
class CancellationSource {
public:
    CancellationSource();

    // Source that fires when `timeout` elapses
    explicit CancellationSource(std::chrono::milliseconds timeout);

    // Child source: fires when the parent fires, or when `timeout` elapses
    // (the earlier of the two deadlines wins)
    CancellationSource(const CancellationToken& parent, std::chrono::milliseconds timeout);

    // Child source without an additional deadline
    explicit CancellationSource(const CancellationToken& parent);

    ~CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken Token() const { return CancellationToken(state_); }

    // Returns false if the source had already been cancelled
    bool Cancel(CancelReason reason = CancelReason::CANCELLED);

    bool IsCancelled() const { return Token().IsCancelled(); }

private:
    std::shared_ptr<detail::CancellationState> state_;
    CancellationRegistration parent_registration_;
};

} // namespace mcpd_server
