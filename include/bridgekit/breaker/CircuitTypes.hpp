#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BK {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen,
};

[[nodiscard]] inline auto circuitStateToString(CircuitState state) -> std::string_view {
    switch (state) {
    case CircuitState::Closed:
        return "closed";
    case CircuitState::Open:
        return "open";
    case CircuitState::HalfOpen:
        return "half_open";
    }
    return "closed";
}

struct CircuitBreakerOptions {
    std::uint32_t             failureThreshold = 5;
    std::chrono::milliseconds timeoutPeriod    = std::chrono::seconds{60}; // per call; <= 0 disables the race
    std::uint32_t             halfOpenMaxCalls = 3;
    std::chrono::milliseconds resetTimeout     = std::chrono::seconds{30}; // time spent Open before probing
    bool                      enableMetrics    = true;
};

struct CircuitMetrics {
    CircuitState  state{CircuitState::Closed};
    std::uint64_t failureCount{0};
    std::uint64_t successCount{0};
    std::uint64_t totalCalls{0};
    std::uint64_t rejectedCalls{0};
    std::uint64_t transitionCount{0};
    std::uint32_t halfOpenTrialCount{0};

    double failureRate{0.0}; // failureCount / totalCalls
    double successRate{0.0};
    double averageResponseTimeMs{0.0};

    std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    std::optional<std::chrono::system_clock::time_point> lastSuccessTime;
    std::optional<std::chrono::system_clock::time_point> openedAt;
};

enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy,
};

[[nodiscard]] inline auto healthStatusToString(HealthStatus status) -> std::string_view {
    switch (status) {
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Degraded:
        return "degraded";
    case HealthStatus::Unhealthy:
        return "unhealthy";
    }
    return "healthy";
}

struct HealthReport {
    HealthStatus             status{HealthStatus::Healthy};
    std::vector<std::string> recommendations;
    CircuitMetrics           metrics;
};

} // namespace BK
