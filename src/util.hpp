#pragma once

#include <string>

namespace resilient_http {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path plus query (e.g. "/v1/ships?limit=10")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input or a non-HTTP scheme.
UrlParts parseUrl(const std::string& url);

/// Lower-case copy of @p s (ASCII only).
std::string toLower(std::string s);

} // namespace resilient_http
