#pragma once
#include "bridgekit/breaker/CircuitTypes.hpp"
#include "bridgekit/core/Error.hpp"
#include "bridgekit/monitor/MetricsSources.hpp"
#include "bridgekit/task/WorkerPool.hpp"
#include "bridgekit/utils/RollingWindow.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace BK {

template <typename T>
struct ExecutionResult {
    Expected<T>              outcome;
    std::chrono::nanoseconds executionTime{0};
    CircuitState             state{CircuitState::Closed}; // state once the call completed

    [[nodiscard]] auto success() const -> bool { return outcome.has_value(); }
};

/**
 * CircuitBreaker: failure-threshold and timeout protection around calls to
 * one named service.
 *
 * Transitions are evaluated lazily at the start of every execute():
 * Open moves to HalfOpen once resetTimeout has elapsed, and Closed moves to
 * Open once failureCount has reached failureThreshold. A failure in Closed
 * therefore opens the circuit on the following call, while any failure in
 * HalfOpen re-opens it immediately.
 *
 * When timeoutPeriod is positive the operation runs on the shared
 * WorkerPool and races the deadline. A timed-out operation keeps running on
 * its worker; its result is discarded.
 */
class CircuitBreaker : public CircuitMetricsSource {
public:
    using StateChangeListener = std::function<void(CircuitState, CircuitMetrics const&)>;
    using ListenerId          = std::uint64_t;

    explicit CircuitBreaker(std::string name, CircuitBreakerOptions options = {});

    CircuitBreaker(CircuitBreaker const&)                    = delete;
    auto operator=(CircuitBreaker const&) -> CircuitBreaker& = delete;

    template <typename T>
    auto execute(std::function<Expected<T>()> operation, std::string_view operationName = {}) -> ExecutionResult<T>;

    [[nodiscard]] auto canExecute() const -> bool;
    [[nodiscard]] auto state() const -> CircuitState;
    [[nodiscard]] auto metrics() const -> CircuitMetrics;
    [[nodiscard]] auto circuitMetrics() const -> CircuitMetrics override { return metrics(); }
    [[nodiscard]] auto healthReport() const -> HealthReport;

    auto reset() -> void;
    auto forceOpen() -> void;
    auto forceClosed() -> void;

    auto onStateChange(StateChangeListener listener) -> ListenerId;
    auto removeStateChangeListener(ListenerId id) -> bool;

    [[nodiscard]] auto name() const -> std::string const& { return name_; }
    [[nodiscard]] auto options() const -> CircuitBreakerOptions const& { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    template <typename T>
    static auto runGuarded(std::function<Expected<T>()> operation, std::chrono::milliseconds timeout) -> Expected<T>;

    // Steps before the operation runs: lazy transitions, then admission.
    auto admit(std::string_view operationName) -> Expected<void>;
    auto onSuccess(std::chrono::nanoseconds elapsed, std::string_view operationName) -> CircuitState;
    auto onFailure(std::chrono::nanoseconds elapsed, Error const& error, std::string_view operationName)
        -> CircuitState;

    auto transitionLocked(CircuitState next, std::vector<CircuitMetrics>& fired) -> void;
    auto metricsLocked() const -> CircuitMetrics;
    auto notify(std::vector<CircuitMetrics> const& fired) -> void;

    std::string           name_;
    CircuitBreakerOptions options_;

    mutable std::mutex                                   mutex_;
    CircuitState                                         state_{CircuitState::Closed};
    std::uint64_t                                        failureCount_{0};
    std::uint64_t                                        successCount_{0};
    std::uint64_t                                        totalCalls_{0};
    std::uint64_t                                        rejectedCalls_{0};
    std::uint64_t                                        transitionCount_{0};
    std::uint32_t                                        halfOpenTrials_{0};
    std::optional<std::chrono::system_clock::time_point> lastFailureTime_;
    std::optional<std::chrono::system_clock::time_point> lastSuccessTime_;
    std::optional<std::chrono::system_clock::time_point> openedAt_;
    std::optional<Clock::time_point>                     openedAtSteady_;
    RollingWindow<double>                                responseTimes_;

    mutable std::mutex                                      listenersMutex_;
    ListenerId                                              nextListenerId_{1};
    std::vector<std::pair<ListenerId, StateChangeListener>> listeners_;
};

template <typename T>
auto CircuitBreaker::execute(std::function<Expected<T>()> operation, std::string_view operationName)
        -> ExecutionResult<T> {
    auto const start = Clock::now();

    if (auto admitted = this->admit(operationName); !admitted) {
        return ExecutionResult<T>{.outcome       = std::unexpected(std::move(admitted.error())),
                                  .executionTime = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start),
                                  .state         = this->state()};
    }

    auto outcome = runGuarded<T>(std::move(operation), options_.timeoutPeriod);
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);

    auto const state = outcome.has_value() ? this->onSuccess(elapsed, operationName)
                                           : this->onFailure(elapsed, outcome.error(), operationName);
    return ExecutionResult<T>{.outcome = std::move(outcome), .executionTime = elapsed, .state = state};
}

template <typename T>
auto CircuitBreaker::runGuarded(std::function<Expected<T>()> operation, std::chrono::milliseconds timeout)
        -> Expected<T> {
    auto guarded = [operation = std::move(operation)]() -> Expected<T> {
        try {
            return operation();
        } catch (std::exception const& e) {
            return std::unexpected(Error{Error::Code::OperationFailed, e.what()});
        } catch (...) {
            return std::unexpected(Error{Error::Code::OperationFailed, "operation threw a non-standard exception"});
        }
    };

    if (timeout <= std::chrono::milliseconds::zero()) {
        return guarded();
    }

    // The task outlives this call when the deadline wins; the worker owns a reference.
    auto task   = std::make_shared<std::packaged_task<Expected<T>()>>(std::move(guarded));
    auto result = task->get_future();
    if (auto error = WorkerPool::Instance().submit([task] { (*task)(); })) {
        return std::unexpected(std::move(*error));
    }

    if (result.wait_for(timeout) == std::future_status::timeout) {
        return std::unexpected(
                Error{Error::Code::OperationTimeout, "operation exceeded " + std::to_string(timeout.count()) + " ms"});
    }
    return result.get();
}

} // namespace BK
