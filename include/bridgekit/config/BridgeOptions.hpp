#pragma once
#include "bridgekit/batch/BatchTypes.hpp"
#include "bridgekit/breaker/CircuitTypes.hpp"
#include "bridgekit/channel/BridgeChannel.hpp"
#include "bridgekit/codec/CodecTypes.hpp"
#include "bridgekit/monitor/MonitorTypes.hpp"

#include <optional>
#include <string>

namespace BK {

struct BridgeOptions {
    std::string           serviceName{"bridge"};
    CodecOptions          codec;
    BatcherOptions        batcher;
    CircuitBreakerOptions breaker;
    MonitorOptions        monitor;
    bool                  showHelp{false};
};

// Environment first (BRIDGEKIT_*), then command-line flags; validated.
auto ParseBridgeArguments(int argc, char** argv) -> std::optional<BridgeOptions>;

void PrintBridgeUsage();

bool ApplyBridgeEnvOverrides(BridgeOptions& options);

auto ValidateBridgeOptions(BridgeOptions const& options) -> std::optional<std::string>;

auto MakeChannelOptions(BridgeOptions const& options) -> ChannelOptions;

} // namespace BK
