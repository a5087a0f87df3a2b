#include "bridgekit/channel/BridgeChannel.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <utility>
#include <vector>

namespace BK {

BridgeChannel::BridgeChannel(Transport transport, BreakerRegistry& registry, BridgeMonitor& monitor, ChannelOptions options)
    : options_(std::move(options))
    , transport_(std::move(transport))
    , monitor_(monitor)
    , codec_(options_.codec)
    , breaker_(registry.breaker(options_.serviceName, options_.breaker)) {
    batcher_ = std::make_unique<Batcher>([this](Batch const& batch) { return this->sendBatch(batch); },
                                         options_.batcher);
    bk_log("Channel '" + options_.serviceName + "' ready", "Channel", "INFO");
}

BridgeChannel::~BridgeChannel() {
    // Drain while the codec and transport are still alive.
    this->shutdown();
}

auto BridgeChannel::send(std::string handler, std::string method, Value params) -> std::future<Batcher::Result> {
    Message message;
    message.id      = "msg-" + std::to_string(++nextMessageId_);
    message.handler = std::move(handler);
    message.method  = std::move(method);
    message.params  = std::move(params);
    return batcher_->enqueue(std::move(message));
}

auto BridgeChannel::flush() -> Expected<std::size_t> {
    return batcher_->flush();
}

auto BridgeChannel::shutdown() -> void {
    batcher_->shutdown();
}

auto BridgeChannel::sendBatch(Batch const& batch) -> Expected<void> {
    Value envelope = Value::array();
    for (auto const& message : batch) {
        envelope.push_back(Value{{"id", message.id},
                                 {"handler", message.handler},
                                 {"method", message.method},
                                 {"params", message.params}});
    }

    auto encoded = codec_.encode(envelope);
    if (!encoded) {
        bk_log("Could not encode batch: " + describeError(encoded.error()), "Channel", "ERROR");
        monitor_.recordOperation("sendBatch", OperationRecord{.success = false, .queueSize = batcher_->queueSize()});
        return std::unexpected(encoded.error());
    }

    auto const& payload = *encoded;

    // A timed-out transport call keeps running detached, so it owns copies of what it touches.
    auto bytes  = std::make_shared<std::vector<std::uint8_t> const>(payload.bytes);
    auto result = breaker_->execute<void>(
            [transport = transport_, bytes]() -> Expected<void> { return transport(*bytes); }, "sendBatch");

    auto const savedPercent = payload.originalSize == 0
                                      ? 0.0
                                      : (static_cast<double>(payload.originalSize)
                                         - static_cast<double>(payload.compressedSize))
                                                / static_cast<double>(payload.originalSize) * 100.0;

    monitor_.recordSerialization(static_cast<double>(payload.originalSize),
                                 static_cast<double>(payload.compressedSize),
                                 std::chrono::duration<double, std::milli>(payload.elapsed).count());
    monitor_.updateComponentMetrics(batcher_.get(), &codec_, breaker_.get());
    monitor_.recordOperation(
            "sendBatch",
            OperationRecord{.latencyMs        = std::chrono::duration<double, std::milli>(result.executionTime).count(),
                            .success          = result.success(),
                            .payloadSize      = payload.compressedSize,
                            .compressionRatio = savedPercent,
                            .queueSize        = batcher_->queueSize()});

    return result.outcome;
}

} // namespace BK
