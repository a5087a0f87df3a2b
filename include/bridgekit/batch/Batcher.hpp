#pragma once
#include "bridgekit/batch/BatchTypes.hpp"
#include "bridgekit/core/Error.hpp"
#include "bridgekit/monitor/MetricsSources.hpp"
#include "bridgekit/utils/RollingWindow.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace BK {

/**
 * Batcher: accumulates outgoing messages and hands them to a send operation
 * in FIFO batches, either when the flush interval elapses or as soon as
 * maxBatchSize messages are pending.
 *
 * Every enqueued message is resolved exactly once: with a Delivery when its
 * batch was sent, or with QueueOverflow, Dropped, BatchSendFailed or
 * Cancelled. At most one flush is in flight at a time. A dedicated timer
 * thread drives interval flushes; it is joined on destruction.
 */
class Batcher : public BatcherMetricsSource {
public:
    using SendBatchFn = std::function<Expected<void>(Batch const&)>;
    using Result      = Expected<Delivery>;

    explicit Batcher(SendBatchFn send, BatcherOptions options = {});
    ~Batcher() override;

    Batcher(Batcher const&)                    = delete;
    auto operator=(Batcher const&) -> Batcher& = delete;

    // The returned future resolves once the message leaves the queue.
    [[nodiscard]] auto enqueue(Message message) -> std::future<Result>;

    // Sends at most one batch. Returns the number of messages sent.
    auto flush() -> Expected<std::size_t>;

    auto clear() -> void;
    auto shutdown() -> void;

    [[nodiscard]] auto queueSize() const -> std::size_t;
    [[nodiscard]] auto isActive() const -> bool;
    [[nodiscard]] auto metrics() const -> BatcherMetrics;
    [[nodiscard]] auto batcherMetrics() const -> BatcherMetrics override { return metrics(); }

    [[nodiscard]] auto options() const -> BatcherOptions const& { return options_; }

private:
    // One-shot completion slot. Resolving consumes the slot; a second
    // resolution finds no shared state and throws std::future_error.
    class ResultSlot {
    public:
        [[nodiscard]] auto future() -> std::future<Result> { return promise_.get_future(); }

        auto resolve(Result result) && -> void {
            auto promise = std::move(promise_);
            promise.set_value(std::move(result));
        }

    private:
        std::promise<Result> promise_;
    };

    struct PendingMessage {
        Message    message;
        ResultSlot slot;
    };

    static auto resolveAll(std::vector<ResultSlot>& slots, Result const& result) -> void;

    auto armTimerLocked() -> void;
    auto timerLoop(std::stop_token stopToken) -> void;
    auto takeAllLocked() -> std::vector<ResultSlot>;

    SendBatchFn    send_;
    BatcherOptions options_;

    // Held for the whole extract/send/resolve cycle.
    std::mutex flushMutex_;

    mutable std::mutex                                   mutex_;
    std::condition_variable_any                          timerCv_;
    std::deque<PendingMessage>                           queue_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool                                                 shutdown_{false};

    std::uint64_t                                        nextBatchId_{0};
    std::uint64_t                                        batchesSent_{0};
    std::uint64_t                                        messagesProcessed_{0};
    std::uint64_t                                        droppedCount_{0};
    std::uint64_t                                        rejectedCount_{0};
    std::uint64_t                                        failedBatches_{0};
    bool                                                 backpressured_{false};
    std::optional<std::chrono::system_clock::time_point> lastFlushTime_;
    RollingWindow<double>                                batchLatencies_;
    std::chrono::steady_clock::time_point                createdAt_;

    std::jthread timer_;
};

} // namespace BK
