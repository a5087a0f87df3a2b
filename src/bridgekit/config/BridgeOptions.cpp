#include "bridgekit/config/BridgeOptions.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <string_view>

namespace BK {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

constexpr std::size_t   kMaxCount    = 1'000'000;
constexpr std::int64_t  kMaxMillis   = 24LL * 60 * 60 * 1000;
constexpr std::uint32_t kMaxAttempts = 10'000;

// Each setter validates, prints `name` in its diagnostic and stores on success.
auto set_count(std::string_view value, char const* name, std::size_t min, std::size_t& target) -> bool {
    std::size_t parsed = target;
    if (!parse_integer_in_range<std::size_t>(value, min, kMaxCount, parsed)) {
        std::cerr << name << " must be within " << min << "-" << kMaxCount << "\n";
        return false;
    }
    target = parsed;
    return true;
}

auto set_attempts(std::string_view value, char const* name, std::uint32_t& target) -> bool {
    std::uint32_t parsed = target;
    if (!parse_integer_in_range<std::uint32_t>(value, 1, kMaxAttempts, parsed)) {
        std::cerr << name << " must be within 1-" << kMaxAttempts << "\n";
        return false;
    }
    target = parsed;
    return true;
}

auto set_millis(std::string_view value, char const* name, std::int64_t min, std::chrono::milliseconds& target)
        -> bool {
    std::int64_t parsed = target.count();
    if (!parse_integer_in_range<std::int64_t>(value, min, kMaxMillis, parsed)) {
        std::cerr << name << " must be within " << min << "-" << kMaxMillis << " ms\n";
        return false;
    }
    target = std::chrono::milliseconds{parsed};
    return true;
}

auto set_flag(std::string_view value, char const* name, bool& target) -> bool {
    auto parsed = parse_bool(value);
    if (!parsed) {
        std::cerr << name << " must be a boolean (1/0, true/false, yes/no, on/off)\n";
        return false;
    }
    target = *parsed;
    return true;
}

auto set_name(std::string_view value, char const* name, std::string& target) -> bool {
    if (value.empty()) {
        std::cerr << name << " must not be empty\n";
        return false;
    }
    target = std::string{value};
    return true;
}

} // namespace

auto ValidateBridgeOptions(BridgeOptions const& options) -> std::optional<std::string> {
    if (options.serviceName.empty()) {
        return std::string{"--service must not be empty"};
    }
    if (options.batcher.maxBatchSize == 0) {
        return std::string{"--batch-size must be >= 1"};
    }
    if (options.batcher.maxQueueSize == 0) {
        return std::string{"--queue-size must be >= 1"};
    }
    if (options.batcher.backpressureEnabled && options.batcher.maxBatchSize > options.batcher.maxQueueSize) {
        return std::string{"--batch-size must not exceed --queue-size while backpressure is enabled"};
    }
    if (options.batcher.flushInterval <= std::chrono::milliseconds::zero()) {
        return std::string{"--flush-interval-ms must be >= 1"};
    }
    if (options.breaker.failureThreshold == 0) {
        return std::string{"--failure-threshold must be >= 1"};
    }
    if (options.breaker.halfOpenMaxCalls == 0) {
        return std::string{"--half-open-calls must be >= 1"};
    }
    if (options.breaker.timeoutPeriod < std::chrono::milliseconds::zero()) {
        return std::string{"--timeout-ms must be >= 0"};
    }
    if (options.breaker.resetTimeout < std::chrono::milliseconds::zero()) {
        return std::string{"--reset-timeout-ms must be >= 0"};
    }
    if (options.codec.maxDepth == 0) {
        return std::string{"--codec-max-depth must be >= 1"};
    }
    if (options.monitor.rollingWindowSize == 0) {
        return std::string{"--monitor-window must be >= 1"};
    }
    return std::nullopt;
}

bool ApplyBridgeEnvOverrides(BridgeOptions& options) {
    if (!apply_env("BRIDGEKIT_SERVICE_NAME", [&](std::string_view value) {
            return set_name(value, "BRIDGEKIT_SERVICE_NAME", options.serviceName);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_BATCH_MAX_SIZE", [&](std::string_view value) {
            return set_count(value, "BRIDGEKIT_BATCH_MAX_SIZE", 1, options.batcher.maxBatchSize);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_QUEUE_MAX_SIZE", [&](std::string_view value) {
            return set_count(value, "BRIDGEKIT_QUEUE_MAX_SIZE", 1, options.batcher.maxQueueSize);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_FLUSH_INTERVAL_MS", [&](std::string_view value) {
            return set_millis(value, "BRIDGEKIT_FLUSH_INTERVAL_MS", 1, options.batcher.flushInterval);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_BACKPRESSURE", [&](std::string_view value) {
            return set_flag(value, "BRIDGEKIT_BACKPRESSURE", options.batcher.backpressureEnabled);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_FAILURE_THRESHOLD", [&](std::string_view value) {
            return set_attempts(value, "BRIDGEKIT_FAILURE_THRESHOLD", options.breaker.failureThreshold);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_TIMEOUT_MS", [&](std::string_view value) {
            return set_millis(value, "BRIDGEKIT_TIMEOUT_MS", 0, options.breaker.timeoutPeriod);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_HALF_OPEN_MAX_CALLS", [&](std::string_view value) {
            return set_attempts(value, "BRIDGEKIT_HALF_OPEN_MAX_CALLS", options.breaker.halfOpenMaxCalls);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_RESET_TIMEOUT_MS", [&](std::string_view value) {
            return set_millis(value, "BRIDGEKIT_RESET_TIMEOUT_MS", 0, options.breaker.resetTimeout);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_CODEC_MAX_DEPTH", [&](std::string_view value) {
            return set_count(value, "BRIDGEKIT_CODEC_MAX_DEPTH", 1, options.codec.maxDepth);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_CODEC_VALIDATION", [&](std::string_view value) {
            return set_flag(value, "BRIDGEKIT_CODEC_VALIDATION", options.codec.enableValidation);
        })) {
        return false;
    }

    if (!apply_env("BRIDGEKIT_MONITOR_WINDOW", [&](std::string_view value) {
            return set_count(value, "BRIDGEKIT_MONITOR_WINDOW", 1, options.monitor.rollingWindowSize);
        })) {
        return false;
    }

    return true;
}

void PrintBridgeUsage() {
    std::cout << "Usage: bridgekit_demo [options]\n"
              << "  --service <name>            Circuit breaker service name (default bridge)\n"
              << "  --batch-size <n>            Messages per batch (default 100)\n"
              << "  --queue-size <n>            Pending message limit (default 1000)\n"
              << "  --flush-interval-ms <ms>    Batch window (default 16)\n"
              << "  --no-backpressure           Let the queue grow past --queue-size\n"
              << "  --failure-threshold <n>     Failures before the circuit opens (default 5)\n"
              << "  --timeout-ms <ms>           Per-call timeout, 0 disables (default 60000)\n"
              << "  --half-open-calls <n>       Trial calls while half-open (default 3)\n"
              << "  --reset-timeout-ms <ms>     Time open before probing (default 30000)\n"
              << "  --codec-max-depth <n>       Deepest value nesting the codec accepts (default 10)\n"
              << "  --no-codec-validation       Accept null values in encode\n"
              << "  --monitor-window <n>        Samples kept by the monitor (default 100)\n"
              << "  --help                      Show this help\n"
              << "Environment: BRIDGEKIT_SERVICE_NAME, BRIDGEKIT_BATCH_MAX_SIZE, BRIDGEKIT_QUEUE_MAX_SIZE,\n"
              << "  BRIDGEKIT_FLUSH_INTERVAL_MS, BRIDGEKIT_BACKPRESSURE, BRIDGEKIT_FAILURE_THRESHOLD,\n"
              << "  BRIDGEKIT_TIMEOUT_MS, BRIDGEKIT_HALF_OPEN_MAX_CALLS, BRIDGEKIT_RESET_TIMEOUT_MS,\n"
              << "  BRIDGEKIT_CODEC_MAX_DEPTH, BRIDGEKIT_CODEC_VALIDATION, BRIDGEKIT_MONITOR_WINDOW\n";
}

std::optional<BridgeOptions> ParseBridgeArguments(int argc, char** argv) {
    BridgeOptions options{};
    if (!ApplyBridgeEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        bool             ok = true;
        if (arg == "--service") {
            auto value = require_value(i, "--service");
            ok         = value && set_name(*value, "--service", options.serviceName);
        } else if (arg == "--batch-size") {
            auto value = require_value(i, "--batch-size");
            ok         = value && set_count(*value, "--batch-size", 1, options.batcher.maxBatchSize);
        } else if (arg == "--queue-size") {
            auto value = require_value(i, "--queue-size");
            ok         = value && set_count(*value, "--queue-size", 1, options.batcher.maxQueueSize);
        } else if (arg == "--flush-interval-ms") {
            auto value = require_value(i, "--flush-interval-ms");
            ok         = value && set_millis(*value, "--flush-interval-ms", 1, options.batcher.flushInterval);
        } else if (arg == "--no-backpressure") {
            options.batcher.backpressureEnabled = false;
        } else if (arg == "--failure-threshold") {
            auto value = require_value(i, "--failure-threshold");
            ok         = value && set_attempts(*value, "--failure-threshold", options.breaker.failureThreshold);
        } else if (arg == "--timeout-ms") {
            auto value = require_value(i, "--timeout-ms");
            ok         = value && set_millis(*value, "--timeout-ms", 0, options.breaker.timeoutPeriod);
        } else if (arg == "--half-open-calls") {
            auto value = require_value(i, "--half-open-calls");
            ok         = value && set_attempts(*value, "--half-open-calls", options.breaker.halfOpenMaxCalls);
        } else if (arg == "--reset-timeout-ms") {
            auto value = require_value(i, "--reset-timeout-ms");
            ok         = value && set_millis(*value, "--reset-timeout-ms", 0, options.breaker.resetTimeout);
        } else if (arg == "--codec-max-depth") {
            auto value = require_value(i, "--codec-max-depth");
            ok         = value && set_count(*value, "--codec-max-depth", 1, options.codec.maxDepth);
        } else if (arg == "--no-codec-validation") {
            options.codec.enableValidation = false;
        } else if (arg == "--monitor-window") {
            auto value = require_value(i, "--monitor-window");
            ok         = value && set_count(*value, "--monitor-window", 1, options.monitor.rollingWindowSize);
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
        if (!ok) {
            return std::nullopt;
        }
    }

    if (auto error = ValidateBridgeOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

auto MakeChannelOptions(BridgeOptions const& options) -> ChannelOptions {
    return ChannelOptions{.serviceName = options.serviceName,
                          .codec       = options.codec,
                          .batcher     = options.batcher,
                          .breaker     = options.breaker};
}

} // namespace BK
