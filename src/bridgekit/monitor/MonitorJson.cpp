#include "bridgekit/monitor/MonitorJson.hpp"

namespace BK {

using json = nlohmann::json;

namespace {

auto epochMillis(std::chrono::system_clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto optionalMillis(std::optional<std::chrono::system_clock::time_point> const& tp) -> json {
    if (!tp) {
        return nullptr;
    }
    return epochMillis(*tp);
}

auto circuitJson(CircuitMetrics const& metrics) -> json {
    return json{{"state", std::string{circuitStateToString(metrics.state)}},
                {"failures", metrics.failureCount},
                {"successes", metrics.successCount},
                {"total_calls", metrics.totalCalls},
                {"rejected_calls", metrics.rejectedCalls},
                {"transitions", metrics.transitionCount},
                {"failure_rate", metrics.failureRate},
                {"success_rate", metrics.successRate},
                {"avg_response_ms", metrics.averageResponseTimeMs},
                {"last_failure", optionalMillis(metrics.lastFailureTime)},
                {"last_success", optionalMillis(metrics.lastSuccessTime)},
                {"opened_at", optionalMillis(metrics.openedAt)}};
}

} // namespace

auto toJson(BridgeMetrics const& metrics) -> json {
    json payload;
    payload["batch_latency"] = json{{"current_ms", metrics.batchLatency.currentMs},
                                    {"avg_ms", metrics.batchLatency.averageMs},
                                    {"p95_ms", metrics.batchLatency.p95Ms},
                                    {"target_ms", metrics.batchLatency.targetMs}};

    payload["batch_efficiency"] = json{{"queue_size", metrics.batchEfficiency.queueSize},
                                       {"messages_per_batch", metrics.batchEfficiency.messagesPerBatch},
                                       {"batch_rate", metrics.batchEfficiency.batchRate},
                                       {"max_queue_size", metrics.batchEfficiency.maxQueueSize}};

    payload["serialization"] = json{{"compression_ratio", metrics.serialization.compressionRatio},
                                    {"payload_size_before", metrics.serialization.payloadSizeBefore},
                                    {"payload_size_after", metrics.serialization.payloadSizeAfter},
                                    {"serialization_ms", metrics.serialization.serializationTimeMs}};

    payload["pagination"] = json{{"page_count", metrics.pagination.pageCount},
                                 {"records_per_page", metrics.pagination.recordsPerPage},
                                 {"page_response_ms", metrics.pagination.pageResponseTimeMs},
                                 {"cursor_cache_hit_rate", metrics.pagination.cursorCacheHitRate}};

    payload["reliability"] = json{{"failure_rate", metrics.reliability.failureRate},
                                  {"success_rate", metrics.reliability.successRate},
                                  {"state", std::string{circuitStateToString(metrics.reliability.state)}},
                                  {"state_transitions", metrics.reliability.stateTransitions},
                                  {"last_failure", optionalMillis(metrics.reliability.lastFailureTime)}};

    payload["health"] = json{{"overall_score", metrics.health.overallScore},
                             {"alert_count", metrics.health.alertCount},
                             {"timestamp", epochMillis(metrics.health.timestamp)}};
    return payload;
}

auto toJson(std::vector<Alert> const& alerts) -> json {
    json list = json::array();
    for (auto const& alert : alerts) {
        list.push_back(json{{"id", alert.id},
                            {"severity", std::string{alertSeverityToString(alert.severity)}},
                            {"category", std::string{alertCategoryToString(alert.category)}},
                            {"title", alert.title},
                            {"message", alert.message},
                            {"timestamp", epochMillis(alert.timestamp)},
                            {"acknowledged", alert.acknowledged}});
    }
    return list;
}

auto toJson(Trends const& trends) -> json {
    json timestamps = json::array();
    for (auto const& tp : trends.timestamps) {
        timestamps.push_back(epochMillis(tp));
    }
    return json{{"latency_ms", trends.latencyMs},
                {"compression_ratio", trends.compressionRatio},
                {"failure_rate", trends.failureRate},
                {"timestamps", std::move(timestamps)}};
}

auto toJson(RegistryHealth const& health) -> json {
    json details = json::object();
    for (auto const& [name, report] : health.details) {
        details[name] = json{{"status", std::string{healthStatusToString(report.status)}},
                             {"recommendations", report.recommendations},
                             {"metrics", circuitJson(report.metrics)}};
    }
    return json{{"status", std::string{healthStatusToString(health.status)}},
                {"breaker_count", health.breakerCount},
                {"healthy", health.healthyCount},
                {"degraded", health.degradedCount},
                {"unhealthy", health.unhealthyCount},
                {"details", std::move(details)}};
}

} // namespace BK
