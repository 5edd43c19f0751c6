#include "backoff.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

namespace resilient_http {

namespace {

// Exactly representable as a double, so the final cast stays in range.
constexpr int64_t kMaxDelayMs = int64_t{1} << 62;

} // namespace

std::chrono::milliseconds computeDelay(int attemptIndex,
                                       std::chrono::milliseconds minDelay,
                                       std::chrono::milliseconds maxDelay,
                                       const BackoffOptions& options) {
    const double floorMs = static_cast<double>(
        std::clamp<int64_t>(minDelay.count(), 0, kMaxDelayMs));
    const double ceilMs  = static_cast<double>(
        std::clamp<int64_t>(maxDelay.count(), 0, kMaxDelayMs));

    // Exponential: min * factor^(attempt-1).
    const int    exponent = std::max(attemptIndex, 1) - 1;
    const double factor   = std::max(options.factor, 1.0);
    double delay = floorMs * std::pow(factor, static_cast<double>(exponent));

    if (options.jitter) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> scale(1.0, 2.0);
        delay *= scale(rng);
    }

    // 0 * inf when the floor is zero and the power overflows.
    if (std::isnan(delay)) {
        delay = floorMs;
    }

    // Clamp; the ceiling wins over the floor.
    delay = std::max(delay, floorMs);
    delay = std::min(delay, ceilMs);

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace resilient_http
