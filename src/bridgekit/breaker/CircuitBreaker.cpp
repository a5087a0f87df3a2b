#include "bridgekit/breaker/CircuitBreaker.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <algorithm>

namespace BK {

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerOptions options)
    : name_(std::move(name))
    , options_(options)
    , responseTimes_(100) {
    bk_log("Circuit breaker '" + name_ + "' created", "CircuitBreaker", "INFO");
}

auto CircuitBreaker::admit(std::string_view operationName) -> Expected<void> {
    std::vector<CircuitMetrics> fired;
    Expected<void>              admitted;
    {
        std::lock_guard const lock{mutex_};
        totalCalls_ += 1;

        auto const now = Clock::now();
        if (state_ == CircuitState::Open && openedAtSteady_ && now - *openedAtSteady_ >= options_.resetTimeout) {
            halfOpenTrials_ = 0;
            this->transitionLocked(CircuitState::HalfOpen, fired);
        } else if (state_ == CircuitState::Closed && failureCount_ >= options_.failureThreshold) {
            openedAt_       = std::chrono::system_clock::now();
            openedAtSteady_ = now;
            this->transitionLocked(CircuitState::Open, fired);
        }

        if (state_ == CircuitState::Open) {
            rejectedCalls_ += 1;
            admitted = std::unexpected(Error{Error::Code::CircuitOpen, "circuit '" + name_ + "' is open"});
        } else if (state_ == CircuitState::HalfOpen) {
            if (halfOpenTrials_ >= options_.halfOpenMaxCalls) {
                rejectedCalls_ += 1;
                admitted = std::unexpected(Error{Error::Code::HalfOpenLimitExceeded,
                                                 "circuit '" + name_ + "' has no half-open trial capacity"});
            } else {
                halfOpenTrials_ += 1;
            }
        }
    }

    if (!admitted && options_.enableMetrics) {
        bk_log("Rejected '" + std::string{operationName} + "' on '" + name_ + "': " + describeError(admitted.error()),
               "CircuitBreaker",
               "WARN");
    }
    this->notify(fired);
    return admitted;
}

auto CircuitBreaker::onSuccess(std::chrono::nanoseconds elapsed, std::string_view operationName) -> CircuitState {
    std::vector<CircuitMetrics> fired;
    CircuitState                state;
    {
        std::lock_guard const lock{mutex_};
        successCount_ += 1;
        responseTimes_.push(std::chrono::duration<double, std::milli>(elapsed).count());
        lastSuccessTime_ = std::chrono::system_clock::now();

        if (state_ == CircuitState::Closed) {
            if (failureCount_ > 0) {
                failureCount_ -= 1;
            }
        } else if (state_ == CircuitState::HalfOpen && halfOpenTrials_ >= options_.halfOpenMaxCalls) {
            failureCount_   = 0;
            halfOpenTrials_ = 0;
            this->transitionLocked(CircuitState::Closed, fired);
        }
        state = state_;
    }

    if (options_.enableMetrics) {
        bk_log("'" + std::string{operationName} + "' succeeded on '" + name_ + "'", "CircuitBreaker", "INFO");
    }
    this->notify(fired);
    return state;
}

auto CircuitBreaker::onFailure(std::chrono::nanoseconds elapsed, Error const& error, std::string_view operationName)
        -> CircuitState {
    std::vector<CircuitMetrics> fired;
    CircuitState                state;
    {
        std::lock_guard const lock{mutex_};
        failureCount_ += 1;
        responseTimes_.push(std::chrono::duration<double, std::milli>(elapsed).count());
        lastFailureTime_ = std::chrono::system_clock::now();

        if (state_ == CircuitState::HalfOpen) {
            openedAt_       = lastFailureTime_;
            openedAtSteady_ = Clock::now();
            halfOpenTrials_ = 0;
            this->transitionLocked(CircuitState::Open, fired);
        }
        state = state_;
    }

    if (options_.enableMetrics) {
        bk_log("'" + std::string{operationName} + "' failed on '" + name_ + "': " + describeError(error),
               "CircuitBreaker",
               "ERROR");
    }
    this->notify(fired);
    return state;
}

auto CircuitBreaker::canExecute() const -> bool {
    std::lock_guard const lock{mutex_};
    return state_ == CircuitState::Closed
           || (state_ == CircuitState::HalfOpen && halfOpenTrials_ < options_.halfOpenMaxCalls);
}

auto CircuitBreaker::state() const -> CircuitState {
    std::lock_guard const lock{mutex_};
    return state_;
}

auto CircuitBreaker::metrics() const -> CircuitMetrics {
    std::lock_guard const lock{mutex_};
    return this->metricsLocked();
}

auto CircuitBreaker::metricsLocked() const -> CircuitMetrics {
    CircuitMetrics metrics;
    metrics.state              = state_;
    metrics.failureCount       = failureCount_;
    metrics.successCount       = successCount_;
    metrics.totalCalls         = totalCalls_;
    metrics.rejectedCalls      = rejectedCalls_;
    metrics.transitionCount    = transitionCount_;
    metrics.halfOpenTrialCount = halfOpenTrials_;
    if (totalCalls_ > 0) {
        metrics.failureRate = static_cast<double>(failureCount_) / static_cast<double>(totalCalls_);
        metrics.successRate = static_cast<double>(successCount_) / static_cast<double>(totalCalls_);
    }
    metrics.averageResponseTimeMs = responseTimes_.average();
    metrics.lastFailureTime       = lastFailureTime_;
    metrics.lastSuccessTime       = lastSuccessTime_;
    metrics.openedAt              = openedAt_;
    return metrics;
}

auto CircuitBreaker::healthReport() const -> HealthReport {
    HealthReport report;
    report.metrics = this->metrics();

    switch (report.metrics.state) {
    case CircuitState::Open:
        report.status = HealthStatus::Unhealthy;
        report.recommendations.emplace_back("Circuit is open - check underlying service health");
        break;
    case CircuitState::HalfOpen:
        report.status = HealthStatus::Degraded;
        report.recommendations.emplace_back("Circuit is half-open - monitoring for stability");
        break;
    case CircuitState::Closed:
        if (report.metrics.failureRate > 0.1) {
            report.status = HealthStatus::Degraded;
            report.recommendations.emplace_back("High failure rate detected - investigate error causes");
        }
        break;
    }

    if (report.metrics.averageResponseTimeMs > 5000.0) {
        report.recommendations.emplace_back(
                "High response times - consider timeout adjustment or service optimization");
    }

    auto const nearThreshold = static_cast<std::uint64_t>(options_.failureThreshold * 0.8);
    if (report.metrics.failureCount > nearThreshold) {
        report.recommendations.emplace_back("Approaching failure threshold - monitor closely");
    }
    return report;
}

auto CircuitBreaker::reset() -> void {
    CircuitMetrics snapshot;
    {
        std::lock_guard const lock{mutex_};
        if (state_ != CircuitState::Closed) {
            transitionCount_ += 1;
        }
        state_          = CircuitState::Closed;
        failureCount_   = 0;
        successCount_   = 0;
        totalCalls_     = 0;
        rejectedCalls_  = 0;
        halfOpenTrials_ = 0;
        lastFailureTime_.reset();
        lastSuccessTime_.reset();
        openedAt_.reset();
        openedAtSteady_.reset();
        responseTimes_.clear();
        snapshot = this->metricsLocked();
    }
    bk_log("Circuit breaker '" + name_ + "' reset", "CircuitBreaker", "INFO");
    this->notify({snapshot});
}

auto CircuitBreaker::forceOpen() -> void {
    std::vector<CircuitMetrics> fired;
    {
        std::lock_guard const lock{mutex_};
        openedAt_       = std::chrono::system_clock::now();
        openedAtSteady_ = Clock::now();
        halfOpenTrials_ = 0;
        this->transitionLocked(CircuitState::Open, fired);
    }
    this->notify(fired);
}

auto CircuitBreaker::forceClosed() -> void {
    std::vector<CircuitMetrics> fired;
    {
        std::lock_guard const lock{mutex_};
        failureCount_   = 0;
        halfOpenTrials_ = 0;
        this->transitionLocked(CircuitState::Closed, fired);
    }
    this->notify(fired);
}

auto CircuitBreaker::onStateChange(StateChangeListener listener) -> ListenerId {
    std::lock_guard const lock{listenersMutex_};
    auto const            id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

auto CircuitBreaker::removeStateChangeListener(ListenerId id) -> bool {
    std::lock_guard const lock{listenersMutex_};
    auto const            it = std::find_if(listeners_.begin(), listeners_.end(), [id](auto const& entry) {
        return entry.first == id;
    });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

auto CircuitBreaker::transitionLocked(CircuitState next, std::vector<CircuitMetrics>& fired) -> void {
    if (state_ == next) {
        return;
    }
    bk_log("Circuit '" + name_ + "' " + std::string{circuitStateToString(state_)} + " -> "
                   + std::string{circuitStateToString(next)},
           "CircuitBreaker",
           "WARN");
    state_ = next;
    transitionCount_ += 1;
    fired.push_back(this->metricsLocked());
}

auto CircuitBreaker::notify(std::vector<CircuitMetrics> const& fired) -> void {
    if (fired.empty()) {
        return;
    }
    std::vector<StateChangeListener> listeners;
    {
        std::lock_guard const lock{listenersMutex_};
        listeners.reserve(listeners_.size());
        for (auto const& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }
    for (auto const& metrics : fired) {
        for (auto const& listener : listeners) {
            listener(metrics.state, metrics);
        }
    }
}

} // namespace BK
