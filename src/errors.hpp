#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace resilient_http {

/// Failure raised below HTTP semantics (DNS, connect, read, TLS, bad input).
/// Carries no status code; the message is the transport's own text.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message,
                            std::optional<std::string> code = std::nullopt)
        : std::runtime_error(message)
        , mCode(std::move(code)) {}

    /// Machine-readable code such as "ECONNRESET", if the transport knows one.
    const std::optional<std::string>& code() const { return mCode; }

    bool isHttpError() const { return false; }

private:
    std::optional<std::string> mCode;
};

/// A response with status >= 400 that ended the call.
class HttpError : public std::runtime_error {
public:
    HttpError(int statusCode, const std::string& reason, nlohmann::json data);

    int                   statusCode()  const { return mStatusCode; }
    const std::string&    reason()      const { return mReason; }
    /// Body of the response that produced this error.
    const nlohmann::json& data()        const { return mData; }

    bool isHttpError() const { return true; }

private:
    int            mStatusCode;
    std::string    mReason;
    nlohmann::json mData;
};

/// Standard reason phrase for an HTTP status ("Too Many Requests" for 429).
/// Unregistered codes yield "Unknown Status".
std::string reasonPhrase(int statusCode);

} // namespace resilient_http
