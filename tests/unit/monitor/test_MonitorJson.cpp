#include <doctest/doctest.h>
#include "bridgekit/monitor/BridgeMonitor.hpp"
#include "bridgekit/monitor/MonitorJson.hpp"

using namespace BK;
using namespace std::chrono_literals;

TEST_CASE("Monitor snapshot exports to JSON") {
    BridgeMonitor monitor;
    monitor.recordSerialization(400.0, 350.0, 0.2);
    monitor.recordOperation("op", OperationRecord{.latencyMs = 20.0, .success = false, .queueSize = 4});

    auto const json = toJson(monitor.metrics());
    CHECK(json["batch_latency"]["current_ms"].get<double>() == doctest::Approx(20.0));
    CHECK(json["batch_latency"]["target_ms"].get<double>() == doctest::Approx(16.0));
    CHECK(json["batch_efficiency"]["queue_size"].get<std::size_t>() == 4);
    CHECK(json["serialization"]["compression_ratio"].get<double>() == doctest::Approx(12.5));
    CHECK(json["reliability"]["state"] == "closed");
    CHECK(json["reliability"]["last_failure"].is_null());
    CHECK(json["health"]["alert_count"].get<std::size_t>() == 3);
    CHECK(json["health"]["timestamp"].is_number_integer());

    auto const alerts = toJson(monitor.alerts());
    REQUIRE(alerts.is_array());
    REQUIRE(alerts.size() == 3);
    for (auto const& alert : alerts) {
        CHECK(alert["severity"] == "critical");
        CHECK(alert["acknowledged"] == false);
        CHECK(alert.contains("title"));
    }
}

TEST_CASE("Trends and registry health export to JSON") {
    BridgeMonitor monitor;
    monitor.recordOperation("op", OperationRecord{.latencyMs = 2.0, .success = true});
    auto const trends = toJson(monitor.trends(60s));
    CHECK(trends["latency_ms"].size() == 1);
    CHECK(trends["timestamps"].size() == 1);

    BreakerRegistry registry;
    registry.breaker("render")->forceOpen();
    auto const health = toJson(registry.overallHealth());
    CHECK(health["status"] == "unhealthy");
    CHECK(health["breaker_count"] == 1);
    CHECK(health["details"]["render"]["metrics"]["state"] == "open");
    CHECK(health["details"]["render"]["recommendations"].size() == 1);
}
