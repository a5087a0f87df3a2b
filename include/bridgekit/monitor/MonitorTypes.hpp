#pragma once
#include "bridgekit/breaker/CircuitTypes.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BK {

enum class AlertSeverity {
    Info,
    Warning,
    Error,
    Critical,
};

enum class AlertCategory {
    Latency,
    Compression,
    Reliability,
    Capacity,
};

[[nodiscard]] auto alertSeverityToString(AlertSeverity severity) -> std::string_view;
[[nodiscard]] auto alertCategoryToString(AlertCategory category) -> std::string_view;

struct Alert {
    std::string                           id; // one fixed id per checked metric
    AlertSeverity                         severity{AlertSeverity::Info};
    AlertCategory                         category{AlertCategory::Latency};
    std::string                           title;
    std::string                           message;
    std::chrono::system_clock::time_point timestamp{};
    bool                                  acknowledged{false};
};

// Latency in ms; all other thresholds in percent.
struct AlertThresholds {
    double latencyWarning      = 12.0;
    double latencyCritical     = 16.0;
    double compressionWarning  = 30.0; // lower is worse
    double compressionCritical = 20.0;
    double failureRateWarning  = 5.0;
    double failureRateCritical = 10.0;
    double queueUsageWarning   = 70.0;
    double queueUsageCritical  = 90.0;
};

struct MonitorOptions {
    std::size_t     rollingWindowSize = 100;
    std::size_t     reliabilityWindow = 10;
    double          latencyTargetMs   = 16.0; // one 60 Hz frame
    std::size_t     defaultQueueLimit = 1000;
    AlertThresholds thresholds;
};

struct OperationRecord {
    std::optional<double>      latencyMs;
    std::optional<bool>        success;
    std::optional<std::size_t> payloadSize;
    std::optional<double>      compressionRatio; // percent saved
    std::optional<std::size_t> queueSize;
};

struct BridgeMetrics {
    struct BatchLatency {
        double currentMs{0.0};
        double averageMs{0.0};
        double p95Ms{0.0};
        double targetMs{16.0};
    };

    struct BatchEfficiency {
        std::size_t queueSize{0};
        double      messagesPerBatch{0.0};
        double      batchRate{0.0}; // batches per second
        std::size_t maxQueueSize{1000};
    };

    struct Serialization {
        bool   reported{false};
        double compressionRatio{0.0}; // percent saved against the textual size
        double payloadSizeBefore{0.0};
        double payloadSizeAfter{0.0};
        double serializationTimeMs{0.0};
    };

    struct Pagination {
        std::size_t pageCount{0};
        double      recordsPerPage{50.0};
        double      pageResponseTimeMs{0.0};
        double      cursorCacheHitRate{0.0};
    };

    struct Reliability {
        double                                               failureRate{0.0}; // percent
        double                                               successRate{100.0};
        CircuitState                                         state{CircuitState::Closed};
        std::uint64_t                                        stateTransitions{0};
        std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    };

    struct Health {
        double                                overallScore{100.0};
        std::size_t                           alertCount{0};
        std::chrono::system_clock::time_point timestamp{};
    };

    BatchLatency    batchLatency;
    BatchEfficiency batchEfficiency;
    Serialization   serialization;
    Pagination      pagination;
    Reliability     reliability;
    Health          health;
};

// Parallel, time-ordered series over the samples inside a trailing window.
struct Trends {
    std::vector<double>                                latencyMs;
    std::vector<double>                                compressionRatio;
    std::vector<double>                                failureRate;
    std::vector<std::chrono::system_clock::time_point> timestamps;
};

} // namespace BK
