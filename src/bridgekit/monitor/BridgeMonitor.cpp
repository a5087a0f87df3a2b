#include "bridgekit/monitor/BridgeMonitor.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace BK {

namespace {

auto oneDecimal(double value) -> std::string {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", value);
    return buffer;
}

auto average(std::vector<double> const& values) -> double {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (auto value : values) {
        sum += value;
    }
    return sum / static_cast<double>(values.size());
}

// Nearest-rank percentile: the value at rank ceil(p/100 * n), clamped.
auto percentile(std::vector<double> values, double p) -> double {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    auto const rank  = static_cast<long>(std::ceil(p / 100.0 * static_cast<double>(values.size())));
    auto const index = std::clamp<long>(rank - 1, 0, static_cast<long>(values.size()) - 1);
    return values[static_cast<std::size_t>(index)];
}

auto healthScore(double latencyMs, double failureRate, std::optional<double> compressionRatio, double queueUsage)
        -> double {
    double score = 100.0;
    if (latencyMs > 16.0) {
        score -= std::min(30.0, (latencyMs - 16.0) * 2.0);
    }
    score -= std::min(40.0, failureRate * 4.0);
    if (compressionRatio && *compressionRatio < 40.0) {
        score -= std::min(20.0, (40.0 - *compressionRatio) * 0.5);
    }
    if (queueUsage > 70.0) {
        score -= std::min(10.0, (queueUsage - 70.0) * 0.3);
    }
    return std::max(0.0, std::round(score));
}

} // namespace

auto alertSeverityToString(AlertSeverity severity) -> std::string_view {
    switch (severity) {
    case AlertSeverity::Info:
        return "info";
    case AlertSeverity::Warning:
        return "warning";
    case AlertSeverity::Error:
        return "error";
    case AlertSeverity::Critical:
        return "critical";
    }
    return "info";
}

auto alertCategoryToString(AlertCategory category) -> std::string_view {
    switch (category) {
    case AlertCategory::Latency:
        return "latency";
    case AlertCategory::Compression:
        return "compression";
    case AlertCategory::Reliability:
        return "reliability";
    case AlertCategory::Capacity:
        return "capacity";
    }
    return "latency";
}

BridgeMonitor::BridgeMonitor(MonitorOptions options)
    : options_(options)
    , samples_(options.rollingWindowSize) {
    if (options_.reliabilityWindow == 0) {
        options_.reliabilityWindow = 1;
    }

    auto initial                          = std::make_shared<BridgeMetrics>();
    initial->batchLatency.targetMs        = options_.latencyTargetMs;
    initial->batchEfficiency.maxQueueSize = options_.defaultQueueLimit;
    initial->health.timestamp             = std::chrono::system_clock::now();
    snapshot_.store(std::move(initial));
    publishedAlerts_.store(std::make_shared<std::vector<Alert> const>());
    bk_log("Bridge monitor initialized", "Monitor", "INFO");
}

auto BridgeMonitor::recordOperation(std::string_view operation, OperationRecord const& record) -> void {
    {
        std::lock_guard const lock{mutex_};
        samples_.push(Sample{.timestamp        = std::chrono::system_clock::now(),
                             .latencyMs        = record.latencyMs.value_or(0.0),
                             .compressionRatio = record.compressionRatio.value_or(0.0),
                             .failureCount     = record.success == false ? 1u : 0u,
                             .successCount     = record.success == true ? 1u : 0u,
                             .queueSize        = record.queueSize.value_or(0),
                             .payloadSize      = record.payloadSize.value_or(0)});

        auto snapshot = this->rebuildSnapshotLocked();
        this->checkAlertsLocked(snapshot);
        snapshot.health.alertCount = this->publishAlertsLocked();
        snapshot_.store(std::make_shared<BridgeMetrics const>(std::move(snapshot)));
    }

    if (record.latencyMs && *record.latencyMs > options_.thresholds.latencyWarning) {
        bk_log("High latency detected: " + oneDecimal(*record.latencyMs) + "ms for operation: " + std::string{operation},
               "Monitor",
               "WARN");
    }
}

auto BridgeMonitor::recordSerialization(double beforeSize, double afterSize, double serializationTimeMs) -> void {
    BridgeMetrics::Serialization serialization;
    serialization.reported            = true;
    serialization.compressionRatio    = beforeSize > 0.0 ? (beforeSize - afterSize) / beforeSize * 100.0 : 0.0;
    serialization.payloadSizeBefore   = beforeSize;
    serialization.payloadSizeAfter    = afterSize;
    serialization.serializationTimeMs = serializationTimeMs;

    std::lock_guard const lock{mutex_};
    serialization_ = serialization;
}

auto BridgeMonitor::recordPagination(std::size_t pageCount,
                                     double      recordsPerPage,
                                     double      responseTimeMs,
                                     double      cacheHitRate) -> void {
    std::lock_guard const lock{mutex_};
    pagination_ = BridgeMetrics::Pagination{.pageCount          = pageCount,
                                            .recordsPerPage     = recordsPerPage,
                                            .pageResponseTimeMs = responseTimeMs,
                                            .cursorCacheHitRate = cacheHitRate};
}

auto BridgeMonitor::recordCircuitState(CircuitState  state,
                                       std::uint64_t failures,
                                       std::uint64_t successes,
                                       std::uint64_t transitions) -> void {
    CircuitData data{.state = state, .failureCount = failures, .successCount = successes, .stateTransitions = transitions};

    std::lock_guard const lock{mutex_};
    // Stamp only when the count grew; a repeated report is not a new failure.
    auto const previousFailures = circuit_ ? circuit_->failureCount : 0;
    if (failures > previousFailures) {
        data.lastFailureTime = std::chrono::system_clock::now();
    } else if (failures > 0 && circuit_) {
        data.lastFailureTime = circuit_->lastFailureTime;
    }
    circuit_ = data;
}

auto BridgeMonitor::updateComponentMetrics(BatcherMetricsSource const* batcher,
                                           CodecMetricsSource const*   codec,
                                           CircuitMetricsSource const* breaker) -> void {
    // Pull outside the lock; each source takes its own.
    std::optional<BatcherData>                  batcherData;
    std::optional<BridgeMetrics::Serialization> serialization;
    std::optional<CircuitData>                  circuit;

    if (batcher != nullptr) {
        auto const metrics = batcher->batcherMetrics();
        batcherData        = BatcherData{.averageBatchSize = metrics.averageBatchSize,
                                         .batchesPerSecond = metrics.batchesPerSecond,
                                         .queueLimit       = metrics.maxQueueSize};
    }

    if (codec != nullptr) {
        auto const metrics = codec->codecMetrics();
        if (metrics.totalEncoded > 0) {
            auto const before = static_cast<double>(metrics.lastOriginalSize);
            auto const after  = static_cast<double>(metrics.lastCompressedSize);
            serialization     = BridgeMetrics::Serialization{
                    .reported            = true,
                    .compressionRatio    = before > 0.0 ? (before - after) / before * 100.0 : 0.0,
                    .payloadSizeBefore   = before,
                    .payloadSizeAfter    = after,
                    .serializationTimeMs = metrics.lastEncodeTimeMs};
        }
    }

    if (breaker != nullptr) {
        auto const metrics = breaker->circuitMetrics();
        circuit            = CircuitData{.state            = metrics.state,
                                         .failureCount     = metrics.failureCount,
                                         .successCount     = metrics.successCount,
                                         .stateTransitions = metrics.transitionCount,
                                         .lastFailureTime  = metrics.lastFailureTime};
    }

    std::lock_guard const lock{mutex_};
    if (batcherData) {
        batcher_ = batcherData;
    }
    if (serialization) {
        serialization_ = serialization;
    }
    if (circuit) {
        circuit_ = circuit;
    }
}

auto BridgeMonitor::metrics() const -> BridgeMetrics {
    return *snapshot_.load();
}

auto BridgeMonitor::alerts() const -> std::vector<Alert> {
    return *publishedAlerts_.load();
}

auto BridgeMonitor::trends(std::chrono::milliseconds window) const -> Trends {
    auto const cutoff = std::chrono::system_clock::now() - window;

    Trends                trends;
    std::lock_guard const lock{mutex_};
    for (auto const& sample : samples_) {
        if (sample.timestamp < cutoff) {
            continue;
        }
        auto const total = sample.successCount + sample.failureCount;
        trends.latencyMs.push_back(sample.latencyMs);
        trends.compressionRatio.push_back(sample.compressionRatio);
        trends.failureRate.push_back(total > 0 ? static_cast<double>(sample.failureCount) / total * 100.0 : 0.0);
        trends.timestamps.push_back(sample.timestamp);
    }
    return trends;
}

auto BridgeMonitor::sampleCount() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return samples_.size();
}

auto BridgeMonitor::acknowledge(std::string_view alertId) -> bool {
    std::lock_guard const lock{mutex_};
    auto                  it = alerts_.find(std::string{alertId});
    if (it == alerts_.end()) {
        return false;
    }
    it->second.alert.acknowledged = true;
    this->publishAlertsLocked();
    return true;
}

auto BridgeMonitor::clearAcknowledged() -> void {
    std::lock_guard const lock{mutex_};
    std::erase_if(alerts_, [](auto const& entry) { return entry.second.alert.acknowledged; });
    this->publishAlertsLocked();
}

auto BridgeMonitor::rebuildSnapshotLocked() -> BridgeMetrics {
    BridgeMetrics snapshot;

    std::vector<double> latencies;
    latencies.reserve(samples_.size());
    for (auto const& sample : samples_) {
        if (sample.latencyMs > 0.0) {
            latencies.push_back(sample.latencyMs);
        }
    }

    auto const recent = samples_.tail(options_.reliabilityWindow);
    auto const latest = samples_.back();

    snapshot.batchLatency.currentMs = latest.latencyMs;
    snapshot.batchLatency.averageMs = average(latencies);
    snapshot.batchLatency.p95Ms     = percentile(std::move(latencies), 95.0);
    snapshot.batchLatency.targetMs  = options_.latencyTargetMs;

    snapshot.batchEfficiency.queueSize    = latest.queueSize;
    snapshot.batchEfficiency.maxQueueSize = options_.defaultQueueLimit;
    if (batcher_) {
        snapshot.batchEfficiency.messagesPerBatch = batcher_->averageBatchSize;
        snapshot.batchEfficiency.batchRate        = batcher_->batchesPerSecond;
        if (batcher_->queueLimit > 0) {
            snapshot.batchEfficiency.maxQueueSize = batcher_->queueLimit;
        }
    }

    if (serialization_) {
        snapshot.serialization = *serialization_;
    }
    if (pagination_) {
        snapshot.pagination = *pagination_;
    }

    std::uint64_t failures  = 0;
    std::uint64_t successes = 0;
    for (auto const& sample : recent) {
        failures += sample.failureCount;
        successes += sample.successCount;
    }
    if (auto const total = failures + successes; total > 0) {
        snapshot.reliability.failureRate = static_cast<double>(failures) / static_cast<double>(total) * 100.0;
        snapshot.reliability.successRate = static_cast<double>(successes) / static_cast<double>(total) * 100.0;
    }
    if (circuit_) {
        snapshot.reliability.state            = circuit_->state;
        snapshot.reliability.stateTransitions = circuit_->stateTransitions;
        snapshot.reliability.lastFailureTime  = circuit_->lastFailureTime;
    }

    auto const queueUsage = snapshot.batchEfficiency.maxQueueSize > 0
                                    ? static_cast<double>(snapshot.batchEfficiency.queueSize)
                                              / static_cast<double>(snapshot.batchEfficiency.maxQueueSize) * 100.0
                                    : 0.0;
    auto const compression = snapshot.serialization.reported
                                     ? std::optional<double>{snapshot.serialization.compressionRatio}
                                     : std::nullopt;

    snapshot.health.overallScore = healthScore(snapshot.batchLatency.currentMs,
                                               snapshot.reliability.failureRate,
                                               compression,
                                               queueUsage);
    snapshot.health.timestamp    = std::chrono::system_clock::now();
    return snapshot;
}

auto BridgeMonitor::checkAlertsLocked(BridgeMetrics const& snapshot) -> void {
    auto const& thresholds = options_.thresholds;
    auto const  now        = std::chrono::system_clock::now();

    {
        std::string const id{"latency-threshold"};
        auto const        current = snapshot.batchLatency.currentMs;
        if (current >= thresholds.latencyCritical) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Critical,
                                         .category = AlertCategory::Latency,
                                         .title    = "Critical Bridge Latency",
                                         .message  = "Bridge latency (" + oneDecimal(current)
                                                    + "ms) exceeds critical threshold ("
                                                    + oneDecimal(thresholds.latencyCritical) + "ms)",
                                         .timestamp = now});
        } else if (current >= thresholds.latencyWarning) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Warning,
                                         .category = AlertCategory::Latency,
                                         .title    = "High Bridge Latency",
                                         .message  = "Bridge latency (" + oneDecimal(current)
                                                    + "ms) exceeds warning threshold ("
                                                    + oneDecimal(thresholds.latencyWarning) + "ms)",
                                         .timestamp = now});
        } else {
            this->clearAlertLocked(id);
        }
    }

    {
        // Without any serialization report there is no ratio to judge.
        std::string const id{"compression-efficiency"};
        auto const        current = snapshot.serialization.compressionRatio;
        if (snapshot.serialization.reported && current <= thresholds.compressionCritical) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Critical,
                                         .category = AlertCategory::Compression,
                                         .title    = "Poor Compression Efficiency",
                                         .message  = "Compression ratio (" + oneDecimal(current)
                                                    + "%) below critical threshold ("
                                                    + oneDecimal(thresholds.compressionCritical) + "%)",
                                         .timestamp = now});
        } else if (snapshot.serialization.reported && current <= thresholds.compressionWarning) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Warning,
                                         .category = AlertCategory::Compression,
                                         .title    = "Low Compression Efficiency",
                                         .message  = "Compression ratio (" + oneDecimal(current)
                                                    + "%) below warning threshold ("
                                                    + oneDecimal(thresholds.compressionWarning) + "%)",
                                         .timestamp = now});
        } else {
            this->clearAlertLocked(id);
        }
    }

    {
        std::string const id{"failure-rate"};
        auto const        current = snapshot.reliability.failureRate;
        if (current >= thresholds.failureRateCritical) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Critical,
                                         .category = AlertCategory::Reliability,
                                         .title    = "High Failure Rate",
                                         .message  = "Bridge failure rate (" + oneDecimal(current)
                                                    + "%) exceeds critical threshold ("
                                                    + oneDecimal(thresholds.failureRateCritical) + "%)",
                                         .timestamp = now});
        } else if (current >= thresholds.failureRateWarning) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Warning,
                                         .category = AlertCategory::Reliability,
                                         .title    = "Elevated Failure Rate",
                                         .message  = "Bridge failure rate (" + oneDecimal(current)
                                                    + "%) exceeds warning threshold ("
                                                    + oneDecimal(thresholds.failureRateWarning) + "%)",
                                         .timestamp = now});
        } else {
            this->clearAlertLocked(id);
        }
    }

    {
        std::string const id{"queue-capacity"};
        auto const        current = snapshot.batchEfficiency.queueSize;
        auto const        limit   = snapshot.batchEfficiency.maxQueueSize;
        auto const        usage   = limit > 0 ? static_cast<double>(current) / static_cast<double>(limit) * 100.0 : 0.0;
        auto const        fill    = std::to_string(current) + "/" + std::to_string(limit) + ", " + oneDecimal(usage);
        if (usage >= thresholds.queueUsageCritical) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Critical,
                                         .category = AlertCategory::Capacity,
                                         .title    = "Queue Near Capacity",
                                         .message  = "Message queue (" + fill + "%) near critical capacity ("
                                                    + oneDecimal(thresholds.queueUsageCritical) + "%)",
                                         .timestamp = now});
        } else if (usage >= thresholds.queueUsageWarning) {
            this->raiseAlertLocked(Alert{.id       = id,
                                         .severity = AlertSeverity::Warning,
                                         .category = AlertCategory::Capacity,
                                         .title    = "High Queue Usage",
                                         .message  = "Message queue (" + fill + "%) above warning threshold ("
                                                    + oneDecimal(thresholds.queueUsageWarning) + "%)",
                                         .timestamp = now});
        } else {
            this->clearAlertLocked(id);
        }
    }
}

auto BridgeMonitor::raiseAlertLocked(Alert alert) -> void {
    auto it = alerts_.find(alert.id);
    if (it != alerts_.end() && it->second.alert.severity == alert.severity) {
        // Same breach persisting: refresh the text, keep when it started and its acknowledgement.
        it->second.alert.message = std::move(alert.message);
        return;
    }

    if (it == alerts_.end() || alert.severity > it->second.alert.severity) {
        bk_log(std::string{alertSeverityToString(alert.severity)} + " alert " + alert.id + ": " + alert.message,
               "Monitor",
               "WARN");
    }
    auto const id = alert.id;
    alerts_.insert_or_assign(id, AlertEntry{.sequence = ++nextAlertSequence_, .alert = std::move(alert)});
}

auto BridgeMonitor::clearAlertLocked(std::string const& id) -> void {
    if (alerts_.erase(id) > 0) {
        bk_log("Alert " + id + " cleared", "Monitor", "INFO");
    }
}

auto BridgeMonitor::publishAlertsLocked() -> std::size_t {
    std::vector<AlertEntry const*> ordered;
    ordered.reserve(alerts_.size());
    for (auto const& [id, entry] : alerts_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), [](AlertEntry const* lhs, AlertEntry const* rhs) {
        if (lhs->alert.timestamp != rhs->alert.timestamp) {
            return lhs->alert.timestamp > rhs->alert.timestamp;
        }
        return lhs->sequence > rhs->sequence;
    });

    auto list = std::make_shared<std::vector<Alert>>();
    list->reserve(ordered.size());
    for (auto const* entry : ordered) {
        list->push_back(entry->alert);
    }
    auto const count = list->size();
    publishedAlerts_.store(std::move(list));
    return count;
}

OperationScope::OperationScope(BridgeMonitor& monitor, std::string operation)
    : monitor_{monitor}
    , operation_{std::move(operation)}
    , start_{std::chrono::steady_clock::now()} {}

OperationScope::~OperationScope() {
    auto const duration = std::chrono::steady_clock::now() - start_;
    record_.latencyMs   = std::chrono::duration<double, std::milli>(duration).count();
    record_.success     = success_;
    monitor_.recordOperation(operation_, record_);
}

} // namespace BK
