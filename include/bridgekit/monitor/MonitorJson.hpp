#pragma once
#include "bridgekit/breaker/BreakerRegistry.hpp"
#include "bridgekit/monitor/MonitorTypes.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace BK {

// Dashboard export. Timestamps are milliseconds since the Unix epoch.
[[nodiscard]] auto toJson(BridgeMetrics const& metrics) -> nlohmann::json;
[[nodiscard]] auto toJson(std::vector<Alert> const& alerts) -> nlohmann::json;
[[nodiscard]] auto toJson(Trends const& trends) -> nlohmann::json;
[[nodiscard]] auto toJson(RegistryHealth const& health) -> nlohmann::json;

} // namespace BK
