#pragma once
#include "bridgekit/monitor/MetricsSources.hpp"
#include "bridgekit/monitor/MonitorTypes.hpp"
#include "bridgekit/utils/RollingWindow.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BK {

/**
 * BridgeMonitor: passive aggregator of bridge telemetry.
 *
 * Every recordOperation() appends one sample to a rolling window, rebuilds
 * the consolidated BridgeMetrics snapshot and re-evaluates the four alert
 * checks (latency, compression, failure rate, queue capacity). The other
 * record and update calls only store the latest component data; it is
 * folded into the snapshot by the next recordOperation().
 *
 * Snapshots and the alert list are published as immutable copies, so
 * metrics() and alerts() never observe a half-applied update. Nothing here
 * fails; threshold breaches become Alert records.
 */
class BridgeMonitor {
public:
    explicit BridgeMonitor(MonitorOptions options = {});

    BridgeMonitor(BridgeMonitor const&)                    = delete;
    auto operator=(BridgeMonitor const&) -> BridgeMonitor& = delete;

    auto recordOperation(std::string_view operation, OperationRecord const& record) -> void;
    auto recordSerialization(double beforeSize, double afterSize, double serializationTimeMs) -> void;
    auto recordPagination(std::size_t pageCount, double recordsPerPage, double responseTimeMs, double cacheHitRate)
        -> void;
    auto recordCircuitState(CircuitState state, std::uint64_t failures, std::uint64_t successes, std::uint64_t transitions)
        -> void;

    // Null sources are skipped.
    auto updateComponentMetrics(BatcherMetricsSource const* batcher,
                                CodecMetricsSource const*   codec   = nullptr,
                                CircuitMetricsSource const* breaker = nullptr) -> void;

    [[nodiscard]] auto metrics() const -> BridgeMetrics;
    [[nodiscard]] auto alerts() const -> std::vector<Alert>; // newest first
    [[nodiscard]] auto trends(std::chrono::milliseconds window = std::chrono::seconds{60}) const -> Trends;
    [[nodiscard]] auto sampleCount() const -> std::size_t;

    auto acknowledge(std::string_view alertId) -> bool;
    auto clearAcknowledged() -> void;

    [[nodiscard]] auto options() const -> MonitorOptions const& { return options_; }

private:
    struct Sample {
        std::chrono::system_clock::time_point timestamp;
        double                                latencyMs{0.0};
        double                                compressionRatio{0.0};
        std::uint32_t                         failureCount{0};
        std::uint32_t                         successCount{0};
        std::size_t                           queueSize{0};
        std::size_t                           payloadSize{0};
    };

    struct BatcherData {
        double      averageBatchSize{0.0};
        double      batchesPerSecond{0.0};
        std::size_t queueLimit{0};
    };

    struct CircuitData {
        CircuitState                                         state{CircuitState::Closed};
        std::uint64_t                                        failureCount{0};
        std::uint64_t                                        successCount{0};
        std::uint64_t                                        stateTransitions{0};
        std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    };

    struct AlertEntry {
        std::uint64_t sequence{0};
        Alert         alert;
    };

    auto rebuildSnapshotLocked() -> BridgeMetrics;
    auto checkAlertsLocked(BridgeMetrics const& snapshot) -> void;
    auto raiseAlertLocked(Alert alert) -> void;
    auto clearAlertLocked(std::string const& id) -> void;
    auto publishAlertsLocked() -> std::size_t;

    MonitorOptions options_;

    mutable std::mutex                          mutex_;
    RollingWindow<Sample>                       samples_;
    std::optional<BatcherData>                  batcher_;
    std::optional<BridgeMetrics::Serialization> serialization_;
    std::optional<BridgeMetrics::Pagination>    pagination_;
    std::optional<CircuitData>                  circuit_;
    std::map<std::string, AlertEntry>           alerts_;
    std::uint64_t                               nextAlertSequence_{0};

    std::atomic<std::shared_ptr<BridgeMetrics const>>      snapshot_;
    std::atomic<std::shared_ptr<std::vector<Alert> const>> publishedAlerts_;
};

/**
 * OperationScope: times an operation and records it into a monitor when the
 * scope ends. The operation counts as successful unless markFailed() is
 * called.
 */
class OperationScope {
public:
    OperationScope(BridgeMonitor& monitor, std::string operation);
    ~OperationScope();

    OperationScope(OperationScope const&)                    = delete;
    auto operator=(OperationScope const&) -> OperationScope& = delete;

    auto markFailed() -> void { success_ = false; }
    auto setPayloadSize(std::size_t bytes) -> void { record_.payloadSize = bytes; }
    auto setQueueSize(std::size_t size) -> void { record_.queueSize = size; }
    auto setCompressionRatio(double percent) -> void { record_.compressionRatio = percent; }

private:
    BridgeMonitor&                        monitor_;
    std::string                           operation_;
    OperationRecord                       record_;
    bool                                  success_{true};
    std::chrono::steady_clock::time_point start_;
};

} // namespace BK
