#pragma once

#include "options.hpp"

#include <chrono>

namespace resilient_http {

/// Delay before retry number @p attemptIndex (1 = first retry).
///
/// Grows as minDelay * factor^(attemptIndex - 1), optionally scaled by a
/// random value in [1, 2), then clamped to [minDelay, maxDelay]. maxDelay
/// wins when the bounds cross, so a zero in either bound yields 0 ms.
/// Only computes; never sleeps.
std::chrono::milliseconds computeDelay(int attemptIndex,
                                       std::chrono::milliseconds minDelay,
                                       std::chrono::milliseconds maxDelay,
                                       const BackoffOptions& options = {});

} // namespace resilient_http
