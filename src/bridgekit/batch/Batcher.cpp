#include "bridgekit/batch/Batcher.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace BK {

namespace {
using Clock = std::chrono::steady_clock;
}

Batcher::Batcher(SendBatchFn send, BatcherOptions options)
    : send_(std::move(send))
    , options_(options)
    , batchLatencies_(100)
    , createdAt_(Clock::now()) {
    if (options_.maxBatchSize == 0) {
        options_.maxBatchSize = 1;
    }
    timer_ = std::jthread([this](std::stop_token stopToken) { this->timerLoop(stopToken); });
}

Batcher::~Batcher() {
    this->shutdown();
    timer_.request_stop();
    if (timer_.joinable()) {
        timer_.join();
    }
}

auto Batcher::enqueue(Message message) -> std::future<Result> {
    ResultSlot slot;
    auto       future = slot.future();

    std::vector<ResultSlot> evicted;
    bool                    overflowed       = false;
    bool                    reachedBatchSize = false;
    {
        std::lock_guard const lock{mutex_};
        if (shutdown_) {
            std::move(slot).resolve(std::unexpected(Error{Error::Code::Cancelled, "batcher is shut down"}));
            return future;
        }

        if (options_.backpressureEnabled && queue_.size() >= options_.maxQueueSize) {
            auto const evictCount = std::min(queue_.size(), std::max<std::size_t>(1, options_.maxQueueSize / 10));
            evicted.reserve(evictCount);
            for (std::size_t i = 0; i < evictCount; ++i) {
                evicted.push_back(std::move(queue_.front().slot));
                queue_.pop_front();
            }
            droppedCount_ += evictCount;
            rejectedCount_ += 1;
            backpressured_ = true;
            overflowed     = true;
        } else {
            message.enqueueTime = Clock::now();
            queue_.push_back(PendingMessage{std::move(message), std::move(slot)});
            if (!deadline_) {
                this->armTimerLocked();
            }
            reachedBatchSize = queue_.size() >= options_.maxBatchSize;
        }
    }

    if (overflowed) {
        bk_log("Queue overflow, dropped " + std::to_string(evicted.size()) + " messages", "Batcher", "WARN");
        resolveAll(evicted, std::unexpected(Error{Error::Code::Dropped, "evicted by backpressure"}));
        std::move(slot).resolve(std::unexpected(
                Error{Error::Code::QueueOverflow, "queue reached " + std::to_string(options_.maxQueueSize) + " messages"}));
        return future;
    }

    if (reachedBatchSize) {
        if (auto flushed = this->flush(); !flushed) {
            bk_log("Size-triggered flush failed: " + describeError(flushed.error()), "Batcher", "ERROR");
        }
    }
    return future;
}

auto Batcher::flush() -> Expected<std::size_t> {
    std::lock_guard const flushLock{flushMutex_};

    Batch                   batch;
    std::vector<ResultSlot> slots;
    std::uint64_t           batchId = 0;
    Clock::time_point       oldestEnqueue;
    {
        std::lock_guard const lock{mutex_};
        deadline_.reset();
        timerCv_.notify_all();
        if (queue_.empty()) {
            return 0;
        }

        auto const count = std::min(queue_.size(), options_.maxBatchSize);
        batch.reserve(count);
        slots.reserve(count);
        oldestEnqueue = queue_.front().message.enqueueTime;
        for (std::size_t i = 0; i < count; ++i) {
            batch.push_back(std::move(queue_.front().message));
            slots.push_back(std::move(queue_.front().slot));
            queue_.pop_front();
        }
        batchId = ++nextBatchId_;
    }

    Expected<void> sent;
    try {
        sent = send_(batch);
    } catch (std::exception const& e) {
        sent = std::unexpected(Error{Error::Code::TransportFailed, e.what()});
    } catch (...) {
        sent = std::unexpected(Error{Error::Code::TransportFailed, "send threw a non-standard exception"});
    }

    auto const completed = Clock::now();
    {
        std::lock_guard const lock{mutex_};
        lastFlushTime_ = std::chrono::system_clock::now();
        if (sent) {
            batchesSent_ += 1;
            messagesProcessed_ += batch.size();
            backpressured_ = false;
            batchLatencies_.push(std::chrono::duration<double, std::milli>(completed - oldestEnqueue).count());
        } else {
            failedBatches_ += 1;
        }
        if (!queue_.empty() && !deadline_ && !shutdown_) {
            this->armTimerLocked();
        }
    }

    if (!sent) {
        auto const cause = describeError(sent.error());
        bk_log("Batch " + std::to_string(batchId) + " failed: " + cause, "Batcher", "ERROR");
        resolveAll(slots, std::unexpected(Error{Error::Code::BatchSendFailed, cause}));
        return std::unexpected(Error{Error::Code::BatchSendFailed, cause});
    }

    bk_log("Flushed batch " + std::to_string(batchId) + " with " + std::to_string(batch.size()) + " messages",
           "Batcher",
           "INFO");
    resolveAll(slots, Delivery{.batchId = batchId, .batchSize = batch.size()});
    return batch.size();
}

auto Batcher::clear() -> void {
    std::vector<ResultSlot> slots;
    {
        std::lock_guard const lock{mutex_};
        slots = this->takeAllLocked();
    }
    if (!slots.empty()) {
        bk_log("Cancelled " + std::to_string(slots.size()) + " pending messages", "Batcher", "INFO");
    }
    resolveAll(slots, std::unexpected(Error{Error::Code::Cancelled, "batcher cleared"}));
}

auto Batcher::shutdown() -> void {
    if (this->queueSize() > 0) {
        if (auto flushed = this->flush(); !flushed) {
            bk_log("Final flush failed: " + describeError(flushed.error()), "Batcher", "ERROR");
        }
    }

    std::vector<ResultSlot> slots;
    {
        std::lock_guard const lock{mutex_};
        shutdown_ = true;
        slots     = this->takeAllLocked();
    }
    resolveAll(slots, std::unexpected(Error{Error::Code::Cancelled, "batcher shut down"}));
}

auto Batcher::queueSize() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return queue_.size();
}

auto Batcher::isActive() const -> bool {
    std::lock_guard const lock{mutex_};
    return deadline_.has_value() || !queue_.empty();
}

auto Batcher::metrics() const -> BatcherMetrics {
    std::lock_guard const lock{mutex_};

    BatcherMetrics metrics;
    metrics.queueSize         = queue_.size();
    metrics.batchesSent       = batchesSent_;
    metrics.messagesProcessed = messagesProcessed_;
    metrics.averageBatchSize  = batchesSent_ == 0 ? 0.0
                                                   : static_cast<double>(messagesProcessed_)
                                                            / static_cast<double>(batchesSent_);
    metrics.lastFlushTime = lastFlushTime_;
    metrics.backpressured = backpressured_;
    metrics.droppedCount  = droppedCount_;
    metrics.rejectedCount = rejectedCount_;
    metrics.failedBatches = failedBatches_;
    metrics.maxQueueSize  = options_.maxQueueSize;

    auto const uptime = std::chrono::duration<double>(Clock::now() - createdAt_).count();
    metrics.batchesPerSecond      = uptime > 0.0 ? static_cast<double>(batchesSent_) / uptime : 0.0;
    metrics.averageBatchLatencyMs = batchLatencies_.average();
    return metrics;
}

auto Batcher::resolveAll(std::vector<ResultSlot>& slots, Result const& result) -> void {
    for (auto& slot : slots) {
        std::move(slot).resolve(result);
    }
    slots.clear();
}

auto Batcher::armTimerLocked() -> void {
    deadline_ = Clock::now() + options_.flushInterval;
    timerCv_.notify_all();
}

auto Batcher::takeAllLocked() -> std::vector<ResultSlot> {
    deadline_.reset();
    timerCv_.notify_all();

    std::vector<ResultSlot> slots;
    slots.reserve(queue_.size());
    for (auto& pending : queue_) {
        slots.push_back(std::move(pending.slot));
    }
    queue_.clear();
    return slots;
}

auto Batcher::timerLoop(std::stop_token stopToken) -> void {
    std::unique_lock lock{mutex_};
    while (!stopToken.stop_requested()) {
        if (!deadline_) {
            timerCv_.wait(lock, stopToken, [this] { return deadline_.has_value(); });
            continue;
        }

        auto const deadline = *deadline_;
        bool const rearmed  = timerCv_.wait_until(lock, stopToken, deadline, [this, deadline] {
            return !deadline_ || *deadline_ != deadline;
        });
        if (rearmed || stopToken.stop_requested()) {
            continue;
        }

        lock.unlock();
        if (auto flushed = this->flush(); !flushed) {
            bk_log("Interval flush failed: " + describeError(flushed.error()), "Batcher", "ERROR");
        }
        lock.lock();
    }
}

} // namespace BK
