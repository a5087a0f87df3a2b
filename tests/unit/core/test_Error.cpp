#include <doctest/doctest.h>
#include "bridgekit/core/Error.hpp"

using namespace BK;

TEST_CASE("Error descriptions") {
    CHECK(errorCodeToString(Error::Code::QueueOverflow) == "queue_overflow");
    CHECK(errorCodeToString(Error::Code::HalfOpenLimitExceeded) == "half_open_limit_exceeded");

    CHECK(describeError(Error{Error::Code::CircuitOpen}) == "circuit_open");
    CHECK(describeError(Error{Error::Code::BatchSendFailed, "transport_failed:offline"})
          == "batch_send_failed:transport_failed:offline");
    CHECK(describeError(Error{Error::Code::Dropped, ""}) == "dropped");
}
