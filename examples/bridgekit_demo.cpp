#include <bridgekit/channel/BridgeChannel.hpp>
#include <bridgekit/config/BridgeOptions.hpp>
#include <bridgekit/log/TaggedLogger.hpp>
#include <bridgekit/monitor/MonitorJson.hpp>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <span>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// Drives a channel over an in-process loopback transport that decodes every
// batch it receives and fails every seventh call, then prints the monitor state.
int main(int argc, char** argv) {
    auto options = BK::ParseBridgeArguments(argc, argv);
    if (!options) {
        BK::PrintBridgeUsage();
        return 1;
    }
    if (options->showHelp) {
        BK::PrintBridgeUsage();
        return 0;
    }

#ifdef BK_LOG_DEBUG
    BK::set_logging_enabled(true);
    BK::set_thread_name("Demo");
#endif

    BK::Codec                  peer{options->codec};
    std::atomic<std::uint64_t> calls{0};
    std::atomic<std::uint64_t> received{0};

    BK::Transport loopback = [&](std::span<std::uint8_t const> bytes) -> BK::Expected<void> {
        if (++calls % 7 == 0) {
            return std::unexpected(BK::Error{BK::Error::Code::TransportFailed, "loopback dropped the batch"});
        }
        auto decoded = peer.decode(bytes, BK::ValueShape::Array);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        received += decoded->value.size();
        return {};
    };

    BK::BridgeMonitor   monitor{options->monitor};
    BK::BreakerRegistry registry;

    std::size_t delivered = 0;
    std::size_t failed    = 0;
    {
        BK::BridgeChannel channel{loopback, registry, monitor, BK::MakeChannelOptions(*options)};

        std::vector<std::future<BK::Batcher::Result>> pending;
        for (int i = 0; i < 500; ++i) {
            pending.push_back(channel.send("graph",
                                           "updateNode",
                                           BK::Value{{"node", i}, {"label", "node-" + std::to_string(i)}, {"x", i * 1.5}}));
            if (i % 50 == 0) {
                std::this_thread::sleep_for(20ms);
            }
        }
        channel.shutdown();

        for (auto& future : pending) {
            if (future.get()) {
                ++delivered;
            } else {
                ++failed;
            }
        }
    }

    nlohmann::json report;
    report["delivered"] = delivered;
    report["failed"]    = failed;
    report["received"]  = received.load();
    report["metrics"]   = BK::toJson(monitor.metrics());
    report["alerts"]    = BK::toJson(monitor.alerts());
    report["breakers"]  = BK::toJson(registry.overallHealth());
    std::cout << report.dump(2) << std::endl;
    return 0;
}
