#include "bridgekit/codec/Codec.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace BK {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] auto toMillis(std::chrono::nanoseconds elapsed) -> double {
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

// Nesting depth: scalars are 0, containers are 1 + their deepest child.
[[nodiscard]] auto nestingDepth(Value const& value) -> std::size_t {
    if (!value.is_structured()) {
        return 0;
    }
    std::size_t deepest = 0;
    for (auto const& child : value) {
        auto const depth = nestingDepth(child);
        if (depth > deepest) {
            deepest = depth;
        }
    }
    return deepest + 1;
}

// SAX consumer that builds a Value and refuses containers nested deeper than maxDepth,
// so hostile input stops the reader before its recursion gets deep.
class DepthLimitedBuilder {
public:
    using number_integer_t  = Value::number_integer_t;
    using number_unsigned_t = Value::number_unsigned_t;
    using number_float_t    = Value::number_float_t;
    using string_t          = Value::string_t;
    using binary_t          = Value::binary_t;

    DepthLimitedBuilder(Value& root, std::size_t maxDepth)
        : root_(root)
        , maxDepth_(maxDepth) {}

    bool null() { return this->place(Value{}) != nullptr; }
    bool boolean(bool value) { return this->place(Value(value)) != nullptr; }
    bool number_integer(number_integer_t value) { return this->place(Value(value)) != nullptr; }
    bool number_unsigned(number_unsigned_t value) { return this->place(Value(value)) != nullptr; }
    bool number_float(number_float_t value, string_t const&) { return this->place(Value(value)) != nullptr; }
    bool string(string_t& value) { return this->place(Value(std::move(value))) != nullptr; }
    bool binary(binary_t& value) { return this->place(Value(std::move(value))) != nullptr; }

    bool start_object(std::size_t) { return this->open(Value::value_t::object); }
    bool start_array(std::size_t) { return this->open(Value::value_t::array); }

    bool key(string_t& key) {
        pendingMember_ = &(*stack_.back())[key];
        return true;
    }

    bool end_object() {
        stack_.pop_back();
        return true;
    }

    bool end_array() {
        stack_.pop_back();
        return true;
    }

    bool parse_error(std::size_t, std::string const&, Value::exception const& error) {
        error_ = error.what();
        return false;
    }

    [[nodiscard]] auto failure() const -> std::string const& { return error_; }

private:
    auto open(Value::value_t type) -> bool {
        if (stack_.size() >= maxDepth_) {
            error_ = "nesting exceeds max depth " + std::to_string(maxDepth_);
            return false;
        }
        stack_.push_back(this->place(Value(type)));
        return true;
    }

    // Parents are never modified while a child is open, so the stored pointers stay valid.
    auto place(Value&& value) -> Value* {
        if (stack_.empty()) {
            root_ = std::move(value);
            return &root_;
        }
        auto* parent = stack_.back();
        if (parent->is_array()) {
            parent->push_back(std::move(value));
            return &parent->back();
        }
        *pendingMember_ = std::move(value);
        return pendingMember_;
    }

    Value&              root_;
    std::size_t         maxDepth_;
    std::vector<Value*> stack_;
    Value*              pendingMember_{nullptr};
    std::string         error_;
};

} // namespace

auto valueShapeToString(ValueShape shape) -> std::string_view {
    switch (shape) {
    case ValueShape::Any:
        return "any";
    case ValueShape::Null:
        return "null";
    case ValueShape::Boolean:
        return "boolean";
    case ValueShape::Number:
        return "number";
    case ValueShape::String:
        return "string";
    case ValueShape::Array:
        return "array";
    case ValueShape::Object:
        return "object";
    }
    return "any";
}

auto shapeOf(Value const& value) -> ValueShape {
    if (value.is_null()) {
        return ValueShape::Null;
    }
    if (value.is_boolean()) {
        return ValueShape::Boolean;
    }
    if (value.is_number()) {
        return ValueShape::Number;
    }
    if (value.is_string()) {
        return ValueShape::String;
    }
    if (value.is_array()) {
        return ValueShape::Array;
    }
    if (value.is_object()) {
        return ValueShape::Object;
    }
    return ValueShape::Any;
}

Codec::Codec(CodecOptions options)
    : options_(options)
    , encodeTimes_(options.metricsWindow)
    , decodeTimes_(options.metricsWindow)
    , compressionRatios_(options.metricsWindow) {
    bk_log("Codec initialized with maxDepth " + std::to_string(options_.maxDepth), "Codec", "INFO");
}

auto Codec::encode(Value const& value) -> Expected<SerializedPayload> {
    auto const start = Clock::now();

    if (options_.enableValidation && value.is_null()) {
        this->recordError();
        return std::unexpected(Error{Error::Code::ValidationFailed, "cannot encode a null value"});
    }

    if (auto const depth = nestingDepth(value); depth > options_.maxDepth) {
        this->recordError();
        return std::unexpected(Error{Error::Code::EncodingFailed,
                                     "nesting depth " + std::to_string(depth) + " exceeds limit "
                                         + std::to_string(options_.maxDepth)});
    }

    SerializedPayload payload;
    try {
        payload.originalSize = value.dump().size();
        payload.bytes        = Value::to_msgpack(value);
    } catch (nlohmann::json::exception const& e) {
        this->recordError();
        bk_log(std::string("Encoding failed: ") + e.what(), "Codec", "ERROR");
        return std::unexpected(Error{Error::Code::EncodingFailed, e.what()});
    }

    payload.compressedSize   = payload.bytes.size();
    payload.compressionRatio = payload.compressedSize == 0
                                       ? 1.0
                                       : static_cast<double>(payload.originalSize)
                                                 / static_cast<double>(payload.compressedSize);
    payload.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);

    this->recordEncode(payload);
    return payload;
}

auto Codec::decode(std::span<std::uint8_t const> bytes, ValueShape expectedShape) -> Expected<DecodedPayload> {
    auto const start = Clock::now();

    DecodedPayload decoded;
    try {
        DepthLimitedBuilder builder{decoded.value, options_.maxDepth};
        if (!Value::sax_parse(bytes.begin(), bytes.end(), &builder, Value::input_format_t::msgpack)) {
            this->recordError();
            bk_log("Decoding failed: " + builder.failure(), "Codec", "ERROR");
            return std::unexpected(Error{Error::Code::DecodingFailed, builder.failure()});
        }
    } catch (nlohmann::json::exception const& e) {
        this->recordError();
        bk_log(std::string("Decoding failed: ") + e.what(), "Codec", "ERROR");
        return std::unexpected(Error{Error::Code::DecodingFailed, e.what()});
    }

    if (expectedShape != ValueShape::Any) {
        auto const actual = shapeOf(decoded.value);
        if (actual != expectedShape) {
            this->recordError();
            return std::unexpected(Error{Error::Code::DecodingFailed,
                                         "expected " + std::string{valueShapeToString(expectedShape)} + " but decoded "
                                             + std::string{valueShapeToString(actual)}});
        }
    }

    if (options_.enableValidation && decoded.value.is_null()) {
        bk_log("Decoded value is null", "Codec", "WARN");
    }

    decoded.byteSize = bytes.size();
    decoded.elapsed  = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);

    this->recordDecode(decoded.elapsed);
    return decoded;
}

auto Codec::metrics() const -> CodecMetrics {
    std::lock_guard const lock{metricsMutex_};
    return metrics_;
}

auto Codec::resetMetrics() -> void {
    std::lock_guard const lock{metricsMutex_};
    metrics_ = CodecMetrics{};
    encodeTimes_.clear();
    decodeTimes_.clear();
    compressionRatios_.clear();
}

auto Codec::recordEncode(SerializedPayload const& payload) -> void {
    std::lock_guard const lock{metricsMutex_};
    metrics_.totalEncoded += 1;
    metrics_.totalBytesSaved += static_cast<std::int64_t>(payload.originalSize)
                                - static_cast<std::int64_t>(payload.compressedSize);

    encodeTimes_.push(toMillis(payload.elapsed));
    compressionRatios_.push(payload.compressionRatio);

    metrics_.averageEncodeTimeMs     = encodeTimes_.average();
    metrics_.averageCompressionRatio = compressionRatios_.average();
    metrics_.lastOriginalSize        = payload.originalSize;
    metrics_.lastCompressedSize      = payload.compressedSize;
    metrics_.lastEncodeTimeMs        = toMillis(payload.elapsed);
}

auto Codec::recordDecode(std::chrono::nanoseconds elapsed) -> void {
    std::lock_guard const lock{metricsMutex_};
    metrics_.totalDecoded += 1;
    decodeTimes_.push(toMillis(elapsed));
    metrics_.averageDecodeTimeMs = decodeTimes_.average();
}

auto Codec::recordError() -> void {
    std::lock_guard const lock{metricsMutex_};
    metrics_.errorCount += 1;
}

} // namespace BK
