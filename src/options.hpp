#pragma once

#include <chrono>
#include <set>
#include <string>

namespace resilient_http {

/// Transport codes treated as transient (connection-reset class).
inline const std::set<std::string> kDefaultRetryableCodes = {
    "ECONNRESET",
    "ECONNABORTED",
    "EPIPE",
    "ETIMEDOUT",
};

/// Shape of the exponential curve between retries.
struct BackoffOptions {
    double factor = 2.0;
    bool   jitter = false;   // multiply by a random value in [1, 2)
};

/// Configuration captured by a RequestExecutor at construction time.
struct ClientOptions {
    bool disableCustomHeaders = false;   // send only the caller's headers
    bool disableAutomaticJson = false;   // raw text bodies, no JSON parsing

    std::chrono::milliseconds retryMinDelay{1000};
    std::chrono::milliseconds retryMaxDelay{30000};
    BackoffOptions            backoff;
    std::set<std::string>     retryableCodes = kDefaultRetryableCodes;

    std::chrono::milliseconds timeout{30000};   // per attempt
    bool                      verbose = false;
};

} // namespace resilient_http
