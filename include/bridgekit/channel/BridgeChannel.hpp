#pragma once
#include "bridgekit/batch/Batcher.hpp"
#include "bridgekit/breaker/BreakerRegistry.hpp"
#include "bridgekit/codec/Codec.hpp"
#include "bridgekit/monitor/BridgeMonitor.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <span>
#include <string>

namespace BK {

// Moves one encoded batch across the bridge.
using Transport = std::function<Expected<void>(std::span<std::uint8_t const>)>;

struct ChannelOptions {
    std::string           serviceName = "bridge";
    CodecOptions          codec;
    BatcherOptions        batcher;
    CircuitBreakerOptions breaker;
};

/**
 * BridgeChannel: the outgoing path of the bridge.
 *
 * send() queues a message in the batcher. Each flushed batch is encoded as
 * an array of {id, handler, method, params} objects, handed to the
 * transport through the service's circuit breaker, and reported to the
 * monitor together with fresh component metrics. Encoding failures and
 * breaker rejections fail the whole batch.
 */
class BridgeChannel {
public:
    BridgeChannel(Transport transport, BreakerRegistry& registry, BridgeMonitor& monitor, ChannelOptions options = {});
    ~BridgeChannel();

    BridgeChannel(BridgeChannel const&)                    = delete;
    auto operator=(BridgeChannel const&) -> BridgeChannel& = delete;

    [[nodiscard]] auto send(std::string handler, std::string method, Value params = Value::object())
        -> std::future<Batcher::Result>;

    auto flush() -> Expected<std::size_t>;
    auto shutdown() -> void;

    [[nodiscard]] auto codec() -> Codec& { return codec_; }
    [[nodiscard]] auto batcher() -> Batcher& { return *batcher_; }
    [[nodiscard]] auto breaker() const -> std::shared_ptr<CircuitBreaker> const& { return breaker_; }
    [[nodiscard]] auto options() const -> ChannelOptions const& { return options_; }

private:
    auto sendBatch(Batch const& batch) -> Expected<void>;

    ChannelOptions                  options_;
    Transport                       transport_;
    BridgeMonitor&                  monitor_;
    Codec                           codec_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::atomic<std::uint64_t>      nextMessageId_{0};

    // Last: its timer thread calls sendBatch, which uses every member above.
    std::unique_ptr<Batcher> batcher_;
};

} // namespace BK
