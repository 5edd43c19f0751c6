#pragma once

#include "models.hpp"
#include "options.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace resilient_http {

inline const std::string kVersion = "1.0.0";

/// Headers sent with every request unless custom headers are disabled:
/// User-Agent, X-Client-Platform and X-Client-Runtime.
HeaderMap defaultHeaders();

/// Case-insensitive header lookup.
bool hasHeader(const HeaderMap& headers, const std::string& name);

/// Resolve a caller's descriptor into the envelope used for every attempt.
/// Caller headers override defaults (case-insensitively). With
/// disableCustomHeaders the envelope carries exactly the caller's headers.
RequestEnvelope buildEnvelope(const RequestDescriptor& descriptor,
                              const ClientOptions& options);

/// Turn a raw payload into a response body. In JSON mode the text is parsed;
/// empty text becomes null and unparsable text is kept as a JSON string.
nlohmann::json parseBody(const std::string& text, bool json);

/// Serialise a request body for the wire (strings are sent verbatim).
std::string serializeBody(const nlohmann::json& body);

} // namespace resilient_http
