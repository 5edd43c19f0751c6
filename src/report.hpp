#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace resilient_http {

/// JSON view of a successful response: statusCode, headers, body.
nlohmann::json toJson(const Response& response);

/// JSON view of a terminal error: message and isHttpError, plus statusCode
/// and data for HTTP errors or code for transport errors that carry one.
nlohmann::json toJson(const TerminalError& error);

/// Pretty-print a report. Bodies are raw server bytes, so invalid UTF-8 is
/// replaced with U+FFFD instead of failing the dump.
std::string renderJson(const nlohmann::json& report);

} // namespace resilient_http
