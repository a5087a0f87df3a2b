#pragma once

#include "bridgekit/codec/CodecTypes.hpp"
#include "bridgekit/core/Error.hpp"
#include "bridgekit/monitor/MetricsSources.hpp"
#include "bridgekit/utils/RollingWindow.hpp"

#include <cstdint>
#include <mutex>
#include <span>

namespace BK {

/**
 * Codec: MessagePack encoding of generic values with size/timing accounting.
 *
 * encode() measures the compact JSON text of the value as the reference size
 * and the MessagePack bytes as the compressed size. Calls may arrive from any
 * thread; metric updates are serialized by an internal mutex.
 */
class Codec : public CodecMetricsSource {
public:
    explicit Codec(CodecOptions options = {});

    Codec(Codec const&)                    = delete;
    auto operator=(Codec const&) -> Codec& = delete;

    [[nodiscard]] auto encode(Value const& value) -> Expected<SerializedPayload>;
    [[nodiscard]] auto decode(std::span<std::uint8_t const> bytes,
                              ValueShape                    expectedShape = ValueShape::Any)
        -> Expected<DecodedPayload>;

    [[nodiscard]] auto metrics() const -> CodecMetrics;
    auto               resetMetrics() -> void;

    [[nodiscard]] auto codecMetrics() const -> CodecMetrics override { return metrics(); }

    [[nodiscard]] auto options() const -> CodecOptions const& { return options_; }

private:
    auto recordEncode(SerializedPayload const& payload) -> void;
    auto recordDecode(std::chrono::nanoseconds elapsed) -> void;
    auto recordError() -> void;

    CodecOptions options_;

    mutable std::mutex    metricsMutex_;
    CodecMetrics          metrics_;
    RollingWindow<double> encodeTimes_;
    RollingWindow<double> decodeTimes_;
    RollingWindow<double> compressionRatios_;
};

} // namespace BK
