#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace BK {

// Generic structurally encodable value. Object keys keep insertion order.
using Value = nlohmann::ordered_json;

enum class ValueShape {
    Any,
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object,
};

[[nodiscard]] auto valueShapeToString(ValueShape shape) -> std::string_view;
[[nodiscard]] auto shapeOf(Value const& value) -> ValueShape;

struct CodecOptions {
    std::size_t maxDepth         = 10;
    bool        enableValidation = true;
    std::size_t metricsWindow    = 100;
};

struct SerializedPayload {
    std::vector<std::uint8_t> bytes;
    std::size_t               originalSize{0};
    std::size_t               compressedSize{0};
    double                    compressionRatio{1.0}; // originalSize / compressedSize
    std::chrono::nanoseconds  elapsed{0};
};

struct DecodedPayload {
    Value                    value;
    std::chrono::nanoseconds elapsed{0};
    std::size_t              byteSize{0};
};

struct CodecMetrics {
    std::uint64_t totalEncoded{0};
    std::uint64_t totalDecoded{0};
    std::int64_t  totalBytesSaved{0};
    std::uint64_t errorCount{0};

    // Rolling averages over the last CodecOptions::metricsWindow samples.
    double averageEncodeTimeMs{0.0};
    double averageDecodeTimeMs{0.0};
    double averageCompressionRatio{1.0};

    // Most recent successful encode, for dashboards.
    std::size_t lastOriginalSize{0};
    std::size_t lastCompressedSize{0};
    double      lastEncodeTimeMs{0.0};
};

} // namespace BK
