#include "bridgekit/breaker/BreakerRegistry.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <vector>

namespace BK {

auto BreakerRegistry::breaker(std::string const& name, CircuitBreakerOptions const& options)
        -> std::shared_ptr<CircuitBreaker> {
    std::shared_ptr<CircuitBreaker> found;
    breakers_.lazy_emplace_l(
            name,
            [&](auto& entry) { found = entry.second; },
            [&](auto const& ctor) {
                found = std::make_shared<CircuitBreaker>(name, options);
                ctor(name, found);
                bk_log("Registered circuit breaker '" + name + "'", "Registry", "INFO");
            });
    return found;
}

auto BreakerRegistry::allMetrics() const -> std::map<std::string, CircuitMetrics> {
    std::map<std::string, CircuitMetrics> metrics;
    breakers_.for_each([&](auto const& entry) { metrics.emplace(entry.first, entry.second->metrics()); });
    return metrics;
}

auto BreakerRegistry::overallHealth() const -> RegistryHealth {
    RegistryHealth health;
    breakers_.for_each([&](auto const& entry) { health.details.emplace(entry.first, entry.second->healthReport()); });

    health.breakerCount = health.details.size();
    for (auto const& [name, report] : health.details) {
        switch (report.status) {
        case HealthStatus::Healthy:
            health.healthyCount += 1;
            break;
        case HealthStatus::Degraded:
            health.degradedCount += 1;
            break;
        case HealthStatus::Unhealthy:
            health.unhealthyCount += 1;
            break;
        }
    }

    if (health.unhealthyCount > 0) {
        health.status = HealthStatus::Unhealthy;
    } else if (health.degradedCount > 0) {
        health.status = HealthStatus::Degraded;
    }
    return health;
}

auto BreakerRegistry::size() const -> std::size_t {
    return breakers_.size();
}

auto BreakerRegistry::resetAll() -> void {
    // Reset outside the shard locks; listeners may call back into the registry.
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    breakers_.for_each([&](auto const& entry) { breakers.push_back(entry.second); });
    for (auto const& breaker : breakers) {
        breaker->reset();
    }
}

auto defaultRegistry() -> BreakerRegistry& {
    static BreakerRegistry registry;
    return registry;
}

} // namespace BK
