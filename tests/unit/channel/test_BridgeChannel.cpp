#include <doctest/doctest.h>
#include "bridgekit/channel/BridgeChannel.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

using namespace BK;
using namespace std::chrono_literals;

namespace {

// Decodes every batch it receives, the way the far side of the bridge would.
struct LoopbackPeer {
    std::mutex         mutex;
    std::vector<Value> batches;
    std::atomic<bool>  offline{false};

    auto transport() -> Transport {
        return [this](std::span<std::uint8_t const> bytes) -> Expected<void> {
            if (offline) {
                return std::unexpected(Error{Error::Code::TransportFailed, "peer offline"});
            }
            std::lock_guard lock{mutex};
            batches.push_back(Value::from_msgpack(bytes.begin(), bytes.end()));
            return {};
        };
    }
};

auto quietOptions(std::string service) -> ChannelOptions {
    ChannelOptions options;
    options.serviceName           = std::move(service);
    options.batcher.maxBatchSize  = 10;
    options.batcher.flushInterval = 10s;
    options.breaker.timeoutPeriod = 0ms;
    return options;
}

} // namespace

TEST_CASE("BridgeChannel delivers batches through the transport") {
    LoopbackPeer    peer;
    BreakerRegistry registry;
    BridgeMonitor   monitor;
    BridgeChannel   channel{peer.transport(), registry, monitor, quietOptions("loopback")};

    auto first  = channel.send("graph", "update", Value{{"node", 1}});
    auto second = channel.send("graph", "remove", Value{{"node", 2}});
    auto third  = channel.send("ui", "refresh");

    auto const flushed = channel.flush();
    REQUIRE(flushed.has_value());
    CHECK(*flushed == 3);

    auto const delivered = second.get();
    REQUIRE(delivered.has_value());
    CHECK(delivered->batchSize == 3);
    CHECK(first.get().has_value());
    CHECK(third.get().has_value());

    REQUIRE(peer.batches.size() == 1);
    auto const& batch = peer.batches.front();
    REQUIRE(batch.is_array());
    REQUIRE(batch.size() == 3);
    CHECK(batch[0]["id"] == "msg-1");
    CHECK(batch[0]["handler"] == "graph");
    CHECK(batch[0]["method"] == "update");
    CHECK(batch[0]["params"]["node"] == 1);
    CHECK(batch[1]["method"] == "remove");
    CHECK(batch[2]["handler"] == "ui");
    CHECK(batch[2]["params"].is_object());

    CHECK(monitor.sampleCount() == 1);
    auto const metrics = monitor.metrics();
    CHECK(metrics.serialization.reported);
    CHECK(metrics.serialization.payloadSizeBefore > metrics.serialization.payloadSizeAfter);
    CHECK(metrics.reliability.successRate == doctest::Approx(100.0));
    CHECK(channel.codec().metrics().totalEncoded == 1);
    CHECK(registry.size() == 1);
}

TEST_CASE("BridgeChannel size trigger sends without an explicit flush") {
    LoopbackPeer    peer;
    BreakerRegistry registry;
    BridgeMonitor   monitor;
    auto            options      = quietOptions("size-trigger");
    options.batcher.maxBatchSize = 4;
    BridgeChannel channel{peer.transport(), registry, monitor, options};

    std::vector<std::future<Batcher::Result>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(channel.send("graph", "tick", Value{{"i", i}}));
    }
    for (auto& result : results) {
        CHECK(result.get().has_value());
    }
    REQUIRE(peer.batches.size() == 2);
    CHECK(peer.batches[1][0]["params"]["i"] == 4);
    CHECK(monitor.sampleCount() == 2);
}

TEST_CASE("BridgeChannel transport failures fail the batch") {
    LoopbackPeer    peer;
    BreakerRegistry registry;
    BridgeMonitor   monitor;
    peer.offline = true;
    BridgeChannel channel{peer.transport(), registry, monitor, quietOptions("offline")};

    auto pending = channel.send("graph", "update");
    CHECK_FALSE(channel.flush().has_value());

    auto const result = pending.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::BatchSendFailed);
    CHECK(result.error().message.value_or("").find("transport_failed") != std::string::npos);

    auto const metrics = monitor.metrics();
    CHECK(metrics.reliability.successRate == doctest::Approx(0.0));
    CHECK(channel.breaker()->metrics().failureCount == 1);
}

TEST_CASE("BridgeChannel stops calling the transport once the circuit opens") {
    LoopbackPeer    peer;
    BreakerRegistry registry;
    BridgeMonitor   monitor;
    peer.offline                     = true;
    auto options                     = quietOptions("flaky");
    options.breaker.failureThreshold = 2;
    options.breaker.resetTimeout     = 60s;
    BridgeChannel channel{peer.transport(), registry, monitor, options};

    for (int i = 0; i < 2; ++i) {
        auto pending = channel.send("graph", "update");
        CHECK_FALSE(channel.flush().has_value());
        CHECK_FALSE(pending.get().has_value());
    }
    CHECK(channel.breaker()->state() == CircuitState::Closed);

    peer.offline = false;
    auto rejected = channel.send("graph", "update");
    CHECK_FALSE(channel.flush().has_value());
    auto const result = rejected.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message.value_or("").find("circuit_open") != std::string::npos);
    CHECK(peer.batches.empty());
    CHECK(channel.breaker()->state() == CircuitState::Open);

    auto const health = registry.overallHealth();
    CHECK(health.breakerCount == 1);
    CHECK(health.status == HealthStatus::Unhealthy);
}

TEST_CASE("BridgeChannel encoding failure fails the batch before the transport") {
    LoopbackPeer    peer;
    BreakerRegistry registry;
    BridgeMonitor   monitor;
    auto            options = quietOptions("too-deep");
    options.codec.maxDepth  = 3;
    BridgeChannel channel{peer.transport(), registry, monitor, options};

    // batch array, message object, then two more levels of params.
    auto pending = channel.send("graph", "update", Value{{"outer", Value{{"inner", 1}}}});
    auto const flushed = channel.flush();
    REQUIRE_FALSE(flushed.has_value());
    CHECK(flushed.error().code == Error::Code::BatchSendFailed);

    auto const result = pending.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message.value_or("").find("encoding_failed") != std::string::npos);
    CHECK(peer.batches.empty());
    CHECK(channel.breaker()->metrics().totalCalls == 0);
    CHECK(monitor.sampleCount() == 1);
}

TEST_CASE("BridgeChannel shutdown drains queued messages") {
    LoopbackPeer    peer;
    BreakerRegistry registry;
    BridgeMonitor   monitor;
    BridgeChannel   channel{peer.transport(), registry, monitor, quietOptions("drain")};

    auto pending = channel.send("graph", "update");
    channel.shutdown();
    CHECK(pending.get().has_value());
    CHECK(peer.batches.size() == 1);

    auto late = channel.send("graph", "update");
    auto const result = late.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::Cancelled);
}
