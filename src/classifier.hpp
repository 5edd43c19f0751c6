#pragma once

#include "models.hpp"

#include <ostream>
#include <set>
#include <string>

namespace resilient_http {

enum class Verdict {
    Success,
    RetryableFailure,
    TerminalFailure,
};

std::ostream& operator<<(std::ostream& os, Verdict verdict);

/// Decide what one attempt means for the call:
///   - response with status < 400           -> Success
///   - response with status 429             -> RetryableFailure
///   - any other response with status >= 400 -> TerminalFailure
///   - transport error with a retryable code -> RetryableFailure
///   - any other transport error            -> TerminalFailure
/// Pure: the same input always yields the same verdict.
Verdict classify(const AttemptResult& result,
                 const std::set<std::string>& retryableCodes);

/// True for the transport codes in @p retryableCodes.
bool isRetryableTransportError(const TransportError& error,
                               const std::set<std::string>& retryableCodes);

} // namespace resilient_http
