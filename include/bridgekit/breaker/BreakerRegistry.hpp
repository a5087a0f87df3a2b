#pragma once
#include "bridgekit/breaker/CircuitBreaker.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace BK {

struct RegistryHealth {
    HealthStatus                        status{HealthStatus::Healthy};
    std::size_t                         breakerCount{0};
    std::size_t                         healthyCount{0};
    std::size_t                         degradedCount{0};
    std::size_t                         unhealthyCount{0};
    std::map<std::string, HealthReport> details;
};

/**
 * BreakerRegistry: one CircuitBreaker per service name, created on first use.
 *
 * Insertion is atomic per name, so concurrent first access to the same name
 * yields a single breaker. Options only apply when the breaker is created.
 */
class BreakerRegistry {
public:
    // 2^DefaultSubmaps shards, each guarded by its own mutex.
    static constexpr int DefaultSubmaps = 4;

    using BreakerMap = phmap::parallel_node_hash_map<std::string,
                                                     std::shared_ptr<CircuitBreaker>,
                                                     phmap::Hash<std::string>,
                                                     phmap::EqualTo<std::string>,
                                                     std::allocator<std::pair<const std::string,
                                                                              std::shared_ptr<CircuitBreaker>>>,
                                                     DefaultSubmaps,
                                                     std::mutex>;

    BreakerRegistry() = default;

    BreakerRegistry(BreakerRegistry const&)                    = delete;
    auto operator=(BreakerRegistry const&) -> BreakerRegistry& = delete;

    auto breaker(std::string const& name, CircuitBreakerOptions const& options = {})
        -> std::shared_ptr<CircuitBreaker>;

    template <typename T>
    auto execute(std::string const&           name,
                 std::function<Expected<T>()> operation,
                 CircuitBreakerOptions const& options = {}) -> ExecutionResult<T> {
        return this->breaker(name, options)->template execute<T>(std::move(operation), name);
    }

    [[nodiscard]] auto allMetrics() const -> std::map<std::string, CircuitMetrics>;
    [[nodiscard]] auto overallHealth() const -> RegistryHealth;
    [[nodiscard]] auto size() const -> std::size_t;
    auto               resetAll() -> void;

private:
    BreakerMap breakers_;
};

// Process-wide registry for callers that do not carry their own.
auto defaultRegistry() -> BreakerRegistry&;

} // namespace BK
