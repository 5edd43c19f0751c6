#pragma once

#include "models.hpp"

namespace resilient_http {

/// Build the HttpError for a failed response: reason phrase in the message,
/// status code attached, response body kept as data.
HttpError normalizeHttpFailure(const Response& response);

/// Build the terminal error for a failed attempt. Transport errors are
/// returned as they are; responses become HttpError.
TerminalError normalize(const AttemptResult& result);

/// Throw whichever error @p error holds.
[[noreturn]] void rethrow(const TerminalError& error);

/// Human-readable text of whichever error @p error holds.
std::string describe(const TerminalError& error);

} // namespace resilient_http
