#pragma once

#include "models.hpp"

#include <functional>

namespace resilient_http {

/// Performs exactly one HTTP exchange per call. Implementations report
/// every failure through the handler, never by throwing.
class Transport {
public:
    using AttemptHandler = std::function<void(AttemptResult)>;

    virtual ~Transport() = default;

    /// Start one attempt. @p handler is invoked exactly once, from the
    /// io_context the transport runs on, with either a response or a
    /// TransportError.
    virtual void asyncAttempt(const RequestEnvelope& envelope,
                              AttemptHandler handler) = 0;
};

} // namespace resilient_http
