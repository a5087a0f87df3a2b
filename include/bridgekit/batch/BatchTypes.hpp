#pragma once
#include "bridgekit/codec/CodecTypes.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace BK {

struct BatcherOptions {
    std::size_t               maxBatchSize        = 100;
    std::size_t               maxQueueSize        = 1000;
    std::chrono::milliseconds flushInterval       = std::chrono::milliseconds{16}; // one 60 Hz frame
    bool                      backpressureEnabled = true;
};

struct Message {
    std::string                           id;
    std::string                           handler;
    std::string                           method;
    Value                                 params = Value::object();
    std::chrono::steady_clock::time_point enqueueTime{};
};

// Messages are extracted FIFO from the head of the pending queue.
using Batch = std::vector<Message>;

// Resolution of a message whose batch reached the transport.
struct Delivery {
    std::uint64_t batchId{0};
    std::size_t   batchSize{0};
};

struct BatcherMetrics {
    std::size_t   queueSize{0};
    std::uint64_t batchesSent{0};
    std::uint64_t messagesProcessed{0};
    double        averageBatchSize{0.0};

    std::optional<std::chrono::system_clock::time_point> lastFlushTime;

    bool          backpressured{false};
    std::uint64_t droppedCount{0};
    std::uint64_t rejectedCount{0};
    std::uint64_t failedBatches{0};
    std::size_t   maxQueueSize{0};
    double        batchesPerSecond{0.0};
    double        averageBatchLatencyMs{0.0};
};

} // namespace BK
