#include <doctest/doctest.h>
#include "bridgekit/breaker/CircuitBreaker.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace BK;
using namespace std::chrono_literals;

namespace {

auto succeed() -> std::function<Expected<int>()> {
    return [] { return Expected<int>{7}; };
}

auto fail() -> std::function<Expected<int>()> {
    return [] { return Expected<int>{std::unexpected(Error{Error::Code::TransportFailed, "down"})}; };
}

auto fastOptions() -> CircuitBreakerOptions {
    return CircuitBreakerOptions{.failureThreshold = 2,
                                 .timeoutPeriod    = 0ms,
                                 .halfOpenMaxCalls = 2,
                                 .resetTimeout     = 30ms};
}

} // namespace

TEST_CASE("CircuitBreaker passes results through while closed") {
    CircuitBreaker breaker{"svc"};
    auto           result = breaker.execute<int>(succeed(), "read");
    REQUIRE(result.success());
    CHECK(*result.outcome == 7);
    CHECK(result.state == CircuitState::Closed);

    auto failed = breaker.execute<int>(fail(), "read");
    CHECK_FALSE(failed.success());
    CHECK(failed.outcome.error().code == Error::Code::TransportFailed);
    CHECK(breaker.metrics().failureCount == 1);
}

TEST_CASE("CircuitBreaker opens on the call after the threshold") {
    CircuitBreaker breaker{"svc", CircuitBreakerOptions{.failureThreshold = 2, .timeoutPeriod = 1s}};

    std::atomic<int> invocations{0};
    auto             counted = [&]() -> Expected<int> {
        ++invocations;
        return std::unexpected(Error{Error::Code::TransportFailed, "down"});
    };

    CHECK(breaker.execute<int>(counted).state == CircuitState::Closed);
    CHECK(breaker.execute<int>(counted).state == CircuitState::Closed);
    CHECK(invocations == 2);

    auto rejected = breaker.execute<int>(counted);
    REQUIRE_FALSE(rejected.success());
    CHECK(rejected.outcome.error().code == Error::Code::CircuitOpen);
    CHECK(rejected.state == CircuitState::Open);
    CHECK(invocations == 2);

    auto const metrics = breaker.metrics();
    CHECK(metrics.totalCalls == 3);
    CHECK(metrics.rejectedCalls == 1);
    CHECK(metrics.openedAt.has_value());
    CHECK_FALSE(breaker.canExecute());
}

TEST_CASE("CircuitBreaker success decays the failure count while closed") {
    CircuitBreaker breaker{"svc", fastOptions()};
    (void)breaker.execute<int>(fail());
    (void)breaker.execute<int>(succeed());
    CHECK(breaker.metrics().failureCount == 0);

    (void)breaker.execute<int>(fail());
    (void)breaker.execute<int>(succeed());
    (void)breaker.execute<int>(fail());
    CHECK(breaker.state() == CircuitState::Closed);
    CHECK(breaker.execute<int>(succeed()).success());
}

TEST_CASE("CircuitBreaker half-open recovery") {
    CircuitBreaker breaker{"svc", fastOptions()};
    (void)breaker.execute<int>(fail());
    (void)breaker.execute<int>(fail());
    CHECK(breaker.execute<int>(succeed()).outcome.error().code == Error::Code::CircuitOpen);

    std::this_thread::sleep_for(40ms);

    SUBCASE("Enough successes close the circuit") {
        auto first = breaker.execute<int>(succeed());
        REQUIRE(first.success());
        CHECK(first.state == CircuitState::HalfOpen);

        auto second = breaker.execute<int>(succeed());
        REQUIRE(second.success());
        CHECK(second.state == CircuitState::Closed);
        CHECK(breaker.metrics().failureCount == 0);
        CHECK(breaker.canExecute());
    }

    SUBCASE("Any failure re-opens the circuit") {
        CHECK(breaker.execute<int>(succeed()).state == CircuitState::HalfOpen);
        auto failed = breaker.execute<int>(fail());
        CHECK(failed.state == CircuitState::Open);
        CHECK(breaker.execute<int>(succeed()).outcome.error().code == Error::Code::CircuitOpen);
    }
}

TEST_CASE("CircuitBreaker limits concurrent half-open trials") {
    CircuitBreaker breaker{"svc",
                           CircuitBreakerOptions{.failureThreshold = 1,
                                                 .timeoutPeriod    = 2s,
                                                 .halfOpenMaxCalls = 1,
                                                 .resetTimeout     = 10ms}};
    (void)breaker.execute<int>(fail());
    REQUIRE(breaker.execute<int>(succeed()).state == CircuitState::Open);
    std::this_thread::sleep_for(20ms);

    std::atomic<bool> release{false};
    std::atomic<bool> started{false};
    std::thread       trial([&] {
        (void)breaker.execute<int>([&]() -> Expected<int> {
            started = true;
            while (!release) {
                std::this_thread::sleep_for(1ms);
            }
            return 1;
        });
    });

    while (!started) {
        std::this_thread::sleep_for(1ms);
    }
    CHECK_FALSE(breaker.canExecute());
    auto rejected = breaker.execute<int>(succeed());
    CHECK(rejected.outcome.error().code == Error::Code::HalfOpenLimitExceeded);

    release = true;
    trial.join();
    CHECK(breaker.state() == CircuitState::Closed);
}

TEST_CASE("CircuitBreaker timeout") {
    CircuitBreaker breaker{"svc", CircuitBreakerOptions{.timeoutPeriod = 20ms}};

    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto slow     = [finished]() -> Expected<int> {
        std::this_thread::sleep_for(200ms);
        *finished = true;
        return 1;
    };

    auto const start  = std::chrono::steady_clock::now();
    auto       result = breaker.execute<int>(slow, "slow");
    CHECK(std::chrono::steady_clock::now() - start < 150ms);
    REQUIRE_FALSE(result.success());
    CHECK(result.outcome.error().code == Error::Code::OperationTimeout);
    CHECK_FALSE(finished->load());
    CHECK(breaker.metrics().failureCount == 1);

    auto quick = breaker.execute<int>(succeed());
    CHECK(quick.success());
}

TEST_CASE("CircuitBreaker counts thrown exceptions as failures") {
    CircuitBreaker breaker{"svc", CircuitBreakerOptions{.timeoutPeriod = 1s}};
    auto           result = breaker.execute<int>([]() -> Expected<int> { throw std::runtime_error("boom"); });
    REQUIRE_FALSE(result.success());
    CHECK(result.outcome.error().code == Error::Code::OperationFailed);
    CHECK(result.outcome.error().message == std::optional<std::string>{"boom"});
    CHECK(breaker.metrics().failureCount == 1);
}

TEST_CASE("CircuitBreaker half-open trial that throws a non-standard exception") {
    auto options = CircuitBreakerOptions{.failureThreshold = 1, .halfOpenMaxCalls = 1, .resetTimeout = 10ms};

    SUBCASE("Inline") {
        options.timeoutPeriod = 0ms;
    }
    SUBCASE("On the timeout worker") {
        options.timeoutPeriod = 1s;
    }

    CircuitBreaker breaker{"svc", options};
    (void)breaker.execute<int>(fail());
    REQUIRE(breaker.execute<int>(succeed()).state == CircuitState::Open);
    std::this_thread::sleep_for(20ms);

    auto thrown = breaker.execute<int>([]() -> Expected<int> { throw 42; });
    REQUIRE_FALSE(thrown.success());
    CHECK(thrown.outcome.error().code == Error::Code::OperationFailed);
    CHECK(thrown.state == CircuitState::Open);

    // The trial slot was released, so the breaker recovers after the next reset timeout.
    std::this_thread::sleep_for(20ms);
    auto recovered = breaker.execute<int>(succeed());
    REQUIRE(recovered.success());
    CHECK(recovered.state == CircuitState::Closed);
}

TEST_CASE("CircuitBreaker void operations") {
    CircuitBreaker breaker{"svc", fastOptions()};
    auto           result = breaker.execute<void>([]() -> Expected<void> { return {}; });
    CHECK(result.success());
    CHECK(breaker.metrics().successCount == 1);
}

TEST_CASE("CircuitBreaker administrative overrides") {
    CircuitBreaker breaker{"svc", fastOptions()};

    breaker.forceOpen();
    CHECK(breaker.state() == CircuitState::Open);
    CHECK(breaker.execute<int>(succeed()).outcome.error().code == Error::Code::CircuitOpen);

    breaker.forceClosed();
    CHECK(breaker.state() == CircuitState::Closed);
    CHECK(breaker.execute<int>(succeed()).success());

    (void)breaker.execute<int>(fail());
    breaker.reset();
    auto const metrics = breaker.metrics();
    CHECK(metrics.state == CircuitState::Closed);
    CHECK(metrics.totalCalls == 0);
    CHECK(metrics.failureCount == 0);
    CHECK(metrics.successCount == 0);
    CHECK_FALSE(metrics.lastFailureTime.has_value());
}

TEST_CASE("CircuitBreaker state change listeners") {
    CircuitBreaker breaker{"svc", fastOptions()};

    std::vector<CircuitState> seen;
    auto const                id = breaker.onStateChange([&](CircuitState state, CircuitMetrics const& metrics) {
        CHECK(metrics.state == state);
        seen.push_back(state);
    });

    (void)breaker.execute<int>(fail());
    (void)breaker.execute<int>(fail());
    (void)breaker.execute<int>(succeed()); // opens
    std::this_thread::sleep_for(40ms);
    (void)breaker.execute<int>(succeed()); // half-open
    (void)breaker.execute<int>(succeed()); // closed

    CHECK(seen == std::vector<CircuitState>{CircuitState::Open, CircuitState::HalfOpen, CircuitState::Closed});

    breaker.reset();
    CHECK(seen.size() == 4);

    CHECK(breaker.removeStateChangeListener(id));
    CHECK_FALSE(breaker.removeStateChangeListener(id));
    breaker.forceOpen();
    CHECK(seen.size() == 4);
}

TEST_CASE("CircuitBreaker listener may query the breaker") {
    CircuitBreaker breaker{"svc", fastOptions()};
    CircuitState   observed = CircuitState::Closed;
    breaker.onStateChange([&](CircuitState, CircuitMetrics const&) { observed = breaker.state(); });
    breaker.forceOpen();
    CHECK(observed == CircuitState::Open);
}

TEST_CASE("CircuitBreaker health report") {
    SUBCASE("Closed with no failures is healthy") {
        CircuitBreaker breaker{"svc", fastOptions()};
        (void)breaker.execute<int>(succeed());
        auto const report = breaker.healthReport();
        CHECK(report.status == HealthStatus::Healthy);
        CHECK(report.recommendations.empty());
    }

    SUBCASE("Open is unhealthy") {
        CircuitBreaker breaker{"svc", fastOptions()};
        breaker.forceOpen();
        auto const report = breaker.healthReport();
        CHECK(report.status == HealthStatus::Unhealthy);
        REQUIRE_FALSE(report.recommendations.empty());
        CHECK(report.recommendations.front().find("open") != std::string::npos);
    }

    SUBCASE("Closed with a high failure rate is degraded and near the threshold") {
        CircuitBreaker breaker{"svc", CircuitBreakerOptions{.failureThreshold = 5, .timeoutPeriod = 0ms}};
        for (int i = 0; i < 5; ++i) {
            (void)breaker.execute<int>(fail());
        }
        auto const report = breaker.healthReport();
        CHECK(report.status == HealthStatus::Degraded);
        bool approaching = false;
        for (auto const& recommendation : report.recommendations) {
            approaching = approaching || recommendation.find("Approaching failure threshold") != std::string::npos;
        }
        CHECK(approaching);
    }
}
