#include <doctest/doctest.h>
#include "bridgekit/codec/Codec.hpp"

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace BK;

namespace {

auto nested(std::size_t depth) -> Value {
    Value value = 1;
    for (std::size_t i = 0; i < depth; ++i) {
        value = Value::array({value});
    }
    return value;
}

} // namespace

TEST_CASE("Codec round trip") {
    Codec codec;

    SUBCASE("Nested object keeps key order and values") {
        Value value = {{"zeta", 1},
                       {"alpha", "text"},
                       {"list", {1, 2.5, true, nullptr, "x"}},
                       {"inner", {{"b", -7}, {"a", {{"deep", false}}}}}};
        Value const before = value;

        auto encoded = codec.encode(value);
        REQUIRE(encoded.has_value());
        CHECK(value == before);

        auto decoded = codec.decode(encoded->bytes);
        REQUIRE(decoded.has_value());
        CHECK(decoded->value == value);
        CHECK(decoded->value.begin().key() == "zeta");
        CHECK(decoded->byteSize == encoded->bytes.size());
    }

    SUBCASE("Scalars") {
        for (auto const& value : {Value(42), Value(-3), Value(0.125), Value("hello"), Value(false)}) {
            auto encoded = codec.encode(value);
            REQUIRE(encoded.has_value());
            auto decoded = codec.decode(encoded->bytes);
            REQUIRE(decoded.has_value());
            CHECK(decoded->value == value);
        }
    }
}

TEST_CASE("Codec reports sizes against the compact JSON text") {
    Codec       codec;
    Value const value = {{"handler", "graph"}, {"method", "update"}, {"params", {{"ids", {1, 2, 3, 4, 5}}}}};

    auto encoded = codec.encode(value);
    REQUIRE(encoded.has_value());
    CHECK(encoded->originalSize == value.dump().size());
    CHECK(encoded->compressedSize == encoded->bytes.size());
    CHECK(encoded->compressedSize < encoded->originalSize);
    CHECK(encoded->compressionRatio
          == doctest::Approx(static_cast<double>(encoded->originalSize)
                             / static_cast<double>(encoded->compressedSize)));
}

TEST_CASE("Codec encode errors") {
    SUBCASE("Null input fails validation") {
        Codec codec;
        auto  encoded = codec.encode(Value{});
        REQUIRE_FALSE(encoded.has_value());
        CHECK(encoded.error().code == Error::Code::ValidationFailed);
        CHECK(codec.metrics().errorCount == 1);
    }

    SUBCASE("Null input is accepted without validation") {
        Codec codec{CodecOptions{.enableValidation = false}};
        auto  encoded = codec.encode(Value{});
        REQUIRE(encoded.has_value());
        auto decoded = codec.decode(encoded->bytes);
        REQUIRE(decoded.has_value());
        CHECK(decoded->value.is_null());
    }

    SUBCASE("Nesting deeper than maxDepth") {
        Codec codec{CodecOptions{.maxDepth = 3}};
        CHECK(codec.encode(nested(3)).has_value());

        auto encoded = codec.encode(nested(4));
        REQUIRE_FALSE(encoded.has_value());
        CHECK(encoded.error().code == Error::Code::EncodingFailed);
    }

    SUBCASE("String without a textual form") {
        Codec       codec;
        std::string invalid{"bad"};
        invalid.push_back(static_cast<char>(0xFF));
        auto encoded = codec.encode(Value{{"text", invalid}});
        REQUIRE_FALSE(encoded.has_value());
        CHECK(encoded.error().code == Error::Code::EncodingFailed);
    }
}

TEST_CASE("Codec decode errors") {
    Codec codec;

    SUBCASE("Truncated input") {
        auto encoded = codec.encode(Value{{"key", "a somewhat longer string value"}});
        REQUIRE(encoded.has_value());
        std::vector<std::uint8_t> truncated(encoded->bytes.begin(), encoded->bytes.begin() + 5);
        auto                      decoded = codec.decode(truncated);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::DecodingFailed);
    }

    SUBCASE("Empty input") {
        std::vector<std::uint8_t> empty;
        auto                      decoded = codec.decode(empty);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::DecodingFailed);
    }

    SUBCASE("Reserved type byte") {
        std::vector<std::uint8_t> reserved{0xC1};
        CHECK_FALSE(codec.decode(reserved).has_value());
    }

    SUBCASE("Nesting deeper than maxDepth") {
        // A million nested single-element arrays around a nil.
        std::vector<std::uint8_t> hostile(1'000'000, 0x91);
        hostile.push_back(0xC0);
        auto decoded = codec.decode(hostile);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::DecodingFailed);
        CHECK(decoded.error().message.value_or("").find("max depth") != std::string::npos);
        CHECK(codec.metrics().errorCount == 1);
    }

    SUBCASE("Nesting at maxDepth decodes") {
        Codec shallow{CodecOptions{.maxDepth = 3}};
        auto  atLimit = Value::array({Value{{"inner", Value::array({1, 2})}}});
        auto  encoded = shallow.encode(atLimit);
        REQUIRE(encoded.has_value());
        auto decoded = shallow.decode(encoded->bytes);
        REQUIRE(decoded.has_value());
        CHECK(decoded->value == atLimit);

        std::vector<std::uint8_t> tooDeep{0x91, 0x91, 0x91, 0x91, 0xC0};
        CHECK_FALSE(shallow.decode(tooDeep).has_value());
    }

    SUBCASE("Shape mismatch") {
        auto encoded = codec.encode(Value::array({1, 2, 3}));
        REQUIRE(encoded.has_value());
        CHECK(codec.decode(encoded->bytes, ValueShape::Array).has_value());

        auto decoded = codec.decode(encoded->bytes, ValueShape::Object);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::DecodingFailed);
        REQUIRE(decoded.error().message.has_value());
        CHECK(decoded.error().message->find("object") != std::string::npos);
    }
}

TEST_CASE("Codec metrics") {
    Codec codec{CodecOptions{.metricsWindow = 4}};

    Value const value = {{"numbers", {100, 200, 300}}, {"name", "metrics"}};
    for (int i = 0; i < 6; ++i) {
        auto encoded = codec.encode(value);
        REQUIRE(encoded.has_value());
        REQUIRE(codec.decode(encoded->bytes).has_value());
    }
    std::vector<std::uint8_t> garbage{0xC1};
    CHECK_FALSE(codec.decode(garbage).has_value());

    auto const metrics = codec.metrics();
    auto const sample  = codec.encode(value);
    REQUIRE(sample.has_value());

    CHECK(metrics.totalEncoded == 6);
    CHECK(metrics.totalDecoded == 6);
    CHECK(metrics.errorCount == 1);
    CHECK(metrics.totalBytesSaved
          == 6 * (static_cast<std::int64_t>(sample->originalSize) - static_cast<std::int64_t>(sample->compressedSize)));
    CHECK(metrics.averageCompressionRatio == doctest::Approx(sample->compressionRatio));
    CHECK(metrics.lastOriginalSize == sample->originalSize);
    CHECK(metrics.lastCompressedSize == sample->compressedSize);
    CHECK(metrics.averageEncodeTimeMs >= 0.0);

    SUBCASE("Reset clears everything") {
        codec.resetMetrics();
        auto const cleared = codec.metrics();
        CHECK(cleared.totalEncoded == 0);
        CHECK(cleared.totalDecoded == 0);
        CHECK(cleared.errorCount == 0);
        CHECK(cleared.totalBytesSaved == 0);
        CHECK(cleared.averageCompressionRatio == doctest::Approx(1.0));
    }
}

TEST_CASE("Codec concurrent encode keeps exact counts") {
    Codec codec;

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&codec, t] {
            for (int i = 0; i < 50; ++i) {
                auto encoded = codec.encode(Value{{"worker", t}, {"index", i}});
                if (encoded) {
                    (void)codec.decode(encoded->bytes);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto const metrics = codec.metrics();
    CHECK(metrics.totalEncoded == 200);
    CHECK(metrics.totalDecoded == 200);
    CHECK(metrics.errorCount == 0);
}

TEST_CASE("ValueShape helpers") {
    CHECK(shapeOf(Value{}) == ValueShape::Null);
    CHECK(shapeOf(Value(true)) == ValueShape::Boolean);
    CHECK(shapeOf(Value(1.5)) == ValueShape::Number);
    CHECK(shapeOf(Value("s")) == ValueShape::String);
    CHECK(shapeOf(Value::array()) == ValueShape::Array);
    CHECK(shapeOf(Value::object()) == ValueShape::Object);
    CHECK(valueShapeToString(ValueShape::Object) == "object");
}
