#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace resilient_http {

using HeaderMap = std::map<std::string, std::string>;

/// What the caller asks for. One per logical call.
struct RequestDescriptor {
    std::string                   method;
    std::string                   uri;
    HeaderMap                     headers;
    std::optional<nlohmann::json> body;
};

/// Fully resolved request handed to the transport for every attempt.
/// Built once per logical call and never modified afterwards.
struct RequestEnvelope {
    std::string                   method;
    std::string                   uri;
    HeaderMap                     headers;    // defaults merged with caller headers
    bool                          json = true;
    std::optional<nlohmann::json> body;
    std::chrono::milliseconds     timeout{30000};
};

/// Status, headers and body of one HTTP exchange.
struct Response {
    int            statusCode = 0;
    HeaderMap      headers;
    nlohmann::json body;   // parsed document in JSON mode, raw text otherwise
};

inline bool operator==(const Response& a, const Response& b) {
    return a.statusCode == b.statusCode && a.headers == b.headers && a.body == b.body;
}

/// Outcome of a single transport attempt.
using AttemptResult = std::variant<TransportError, Response>;

/// Error that ends a logical call.
using TerminalError = std::variant<HttpError, TransportError>;

/// Outcome of a logical call: exactly one of the two.
using Outcome = std::variant<Response, TerminalError>;

} // namespace resilient_http
