//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/batch_stream.hpp
//
// Bounded channel of result batches fed by a dedicated producer thread
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "executor/cancellation.hpp"
#include "query/query_types.hpp"
#include <deque>
#include <optional>

namespace mcpd_server {

// A finite, non-restartable sequence of StreamBatch.
//
// The producer runs on its own thread and may prepare batch k+1 while the
// consumer handles batch k; at most `capacity` batches are buffered. The
// channel is closed exactly once, when the producer returns or throws.
// Destroying the stream cancels the producer and joins it.
class BatchStream {
public:
    // Producer-side handle
    class Writer {
    public:
        // Blocks while the channel is full. Returns false once the stream is
        // cancelled; the batch is then discarded.
        bool Push(std::vector<Row> rows);

        // Cancellable pacing delay. Returns false if cancelled.
        bool Pause(Duration delay);

        const CancellationToken& Token() const { return token_; }

        uint64_t BatchesWritten() const { return next_sequence_; }

    private:
        friend class BatchStream;
        Writer(BatchStream& stream, CancellationToken token)
            : stream_(stream), token_(std::move(token)) {}

        BatchStream& stream_;
        CancellationToken token_;
        uint64_t next_sequence_ = 0;
    };

    using Producer = std::function<void(Writer&)>;

    // The stream observes `token` and can also be cancelled on its own
    BatchStream(size_t capacity, const CancellationToken& token);
    ~BatchStream();

    BatchStream(const BatchStream&) = delete;
    BatchStream& operator=(const BatchStream&) = delete;

    // Launch the producer thread. May be called once.
    void Start(Producer producer);

    // Next batch in sequence order, or nullopt once the producer finished.
    // Throws QueryError if the producer failed or the stream was cancelled;
    // no batch is returned after cancellation.
    std::optional<StreamBatch> Next();

    void Cancel();

    CancellationToken Token() const { return source_.Token(); }

    bool IsClosed() const;

    // Number of times the channel was closed (0 or 1)
    uint32_t CloseCount() const { return channel_->close_count.load(); }

    uint64_t BatchesDelivered() const { return delivered_; }

    size_t Capacity() const { return channel_->capacity; }

private:
    struct Channel {
        explicit Channel(size_t capacity_p) : capacity(capacity_p) {}

        const size_t capacity;
        std::mutex mutex;
        std::condition_variable not_empty;
        std::condition_variable not_full;
        std::deque<StreamBatch> queue;

        bool closed = false;
        std::optional<QueryError> error;
        std::atomic<uint32_t> close_count{0};
    };

    void Close(std::optional<QueryError> error);

    QueryError CancellationError() const;

    template<typename Predicate>
    void WaitOn(std::condition_variable& cv, std::unique_lock<std::mutex>& lock,
                Predicate pred) const {
        auto deadline = source_.Token().Deadline();
        if (deadline == TimePoint::max()) {
            cv.wait(lock, pred);
        } else {
            cv.wait_until(lock, deadline, pred);
        }
    }

private:
    std::shared_ptr<Channel> channel_;
    CancellationSource source_;
    CancellationRegistration wake_on_cancel_;
    std::thread producer_;
    bool exhausted_ = false;
    uint64_t delivered_ = 0;
};

} // namespace mcpd_server
