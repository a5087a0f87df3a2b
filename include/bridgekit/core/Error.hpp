#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace BK {

struct Error {
    enum class Code {
        UnknownError = 0,
        ValidationFailed,
        EncodingFailed,
        DecodingFailed,
        QueueOverflow,
        Dropped,
        Cancelled,
        BatchSendFailed,
        CircuitOpen,
        HalfOpenLimitExceeded,
        OperationTimeout,
        OperationFailed,
        TransportFailed,
        InvalidConfiguration
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    explicit Error(Code c)
        : code(c) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::ValidationFailed:
        return "validation_failed";
    case Error::Code::EncodingFailed:
        return "encoding_failed";
    case Error::Code::DecodingFailed:
        return "decoding_failed";
    case Error::Code::QueueOverflow:
        return "queue_overflow";
    case Error::Code::Dropped:
        return "dropped";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::BatchSendFailed:
        return "batch_send_failed";
    case Error::Code::CircuitOpen:
        return "circuit_open";
    case Error::Code::HalfOpenLimitExceeded:
        return "half_open_limit_exceeded";
    case Error::Code::OperationTimeout:
        return "operation_timeout";
    case Error::Code::OperationFailed:
        return "operation_failed";
    case Error::Code::TransportFailed:
        return "transport_failed";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace BK
