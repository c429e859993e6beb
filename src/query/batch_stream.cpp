//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// query/batch_stream.cpp
//
// Batch stream implementation
//===----------------------------------------------------------------------===//

#include "query/batch_stream.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

namespace mcpd_server {

//===----------------------------------------------------------------------===//
// Writer
//===----------------------------------------------------------------------===//

bool BatchStream::Writer::Push(std::vector<Row> rows) {
    auto& channel = *stream_.channel_;
    std::unique_lock<std::mutex> lock(channel.mutex);

    stream_.WaitOn(channel.not_full, lock, [this, &channel]() {
        return channel.queue.size() < channel.capacity || token_.IsCancelled();
    });

    if (token_.IsCancelled()) {
        return false;
    }

    StreamBatch batch;
    batch.sequence = next_sequence_++;
    batch.rows = std::move(rows);
    channel.queue.push_back(std::move(batch));

    lock.unlock();
    channel.not_empty.notify_one();
    return true;
}

bool BatchStream::Writer::Pause(Duration delay) {
    return !token_.WaitFor(delay);
}

//===----------------------------------------------------------------------===//
// BatchStream
//===----------------------------------------------------------------------===//

BatchStream::BatchStream(size_t capacity, const CancellationToken& token)
    : channel_(std::make_shared<Channel>(capacity == 0 ? 1 : capacity))
    , source_(token) {

    // Wake both sides when the stream is cancelled. The callback holds the
    // channel so it stays valid even if it races with destruction.
    auto channel = channel_;
    wake_on_cancel_ = source_.Token().OnCancel([channel]() {
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->not_empty.notify_all();
        channel->not_full.notify_all();
    });
}

BatchStream::~BatchStream() {
    source_.Cancel();
    if (producer_.joinable()) {
        producer_.join();
    }
    wake_on_cancel_.Reset();
}

void BatchStream::Start(Producer producer) {
    if (producer_.joinable()) {
        throw std::logic_error("BatchStream already started");
    }

    producer_ = std::thread([this, producer = std::move(producer)]() {
        Writer writer(*this, source_.Token());
        std::optional<QueryError> error;

        try {
            producer(writer);
        } catch (const QueryError& e) {
            error = e;
        } catch (const std::exception& e) {
            LOG_ERROR("batch_stream", "Producer failed: " + std::string(e.what()));
            error = QueryError(QueryErrorCode::INTERNAL, "stream producer failed");
        }

        LOG_TRACE("batch_stream", "Producer finished after " +
                  std::to_string(writer.BatchesWritten()) + " batches");
        Close(std::move(error));
    });
}

std::optional<StreamBatch> BatchStream::Next() {
    if (exhausted_) {
        return std::nullopt;
    }

    auto token = source_.Token();
    auto& channel = *channel_;
    std::unique_lock<std::mutex> lock(channel.mutex);

    WaitOn(channel.not_empty, lock, [&channel, &token]() {
        return !channel.queue.empty() || channel.closed || token.IsCancelled();
    });

    if (channel.closed && channel.queue.empty() && !channel.error) {
        exhausted_ = true;
        return std::nullopt;
    }

    if (token.IsCancelled()) {
        throw CancellationError();
    }

    if (!channel.queue.empty()) {
        StreamBatch batch = std::move(channel.queue.front());
        channel.queue.pop_front();
        delivered_++;
        lock.unlock();
        channel.not_full.notify_one();
        return batch;
    }

    if (channel.closed && channel.error) {
        throw *channel.error;
    }

    // Woken by the deadline before anything arrived
    throw CancellationError();
}

void BatchStream::Cancel() {
    source_.Cancel();
}

bool BatchStream::IsClosed() const {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->closed;
}

void BatchStream::Close(std::optional<QueryError> error) {
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (channel_->closed) {
            LOG_WARN("batch_stream", "Ignoring second close of batch stream");
            return;
        }
        channel_->closed = true;
        channel_->error = std::move(error);
        channel_->close_count++;
    }
    channel_->not_empty.notify_all();
    channel_->not_full.notify_all();
}

QueryError BatchStream::CancellationError() const {
    if (source_.Token().Reason() == CancelReason::DEADLINE_EXCEEDED) {
        return QueryError(QueryErrorCode::DEADLINE_EXCEEDED, "Query timed out");
    }
    return QueryError(QueryErrorCode::CANCELLED, "Query cancelled");
}

} // namespace mcpd_server
