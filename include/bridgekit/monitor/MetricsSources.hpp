#pragma once
#include "bridgekit/batch/BatchTypes.hpp"
#include "bridgekit/breaker/CircuitTypes.hpp"
#include "bridgekit/codec/CodecTypes.hpp"

namespace BK {

/*
 * Narrow read-only capabilities the monitor pulls component metrics through.
 * Implementations return a consistent copy taken under their own lock.
 */

class BatcherMetricsSource {
public:
    virtual ~BatcherMetricsSource()                          = default;
    [[nodiscard]] virtual auto batcherMetrics() const -> BatcherMetrics = 0;
};

class CodecMetricsSource {
public:
    virtual ~CodecMetricsSource()                          = default;
    [[nodiscard]] virtual auto codecMetrics() const -> CodecMetrics = 0;
};

class CircuitMetricsSource {
public:
    virtual ~CircuitMetricsSource()                            = default;
    [[nodiscard]] virtual auto circuitMetrics() const -> CircuitMetrics = 0;
};

} // namespace BK
