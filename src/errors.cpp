#include "errors.hpp"

#include <boost/beast/http/status.hpp>

namespace resilient_http {

namespace http = boost::beast::http;

HttpError::HttpError(int statusCode, const std::string& reason, nlohmann::json data)
    : std::runtime_error("HTTP " + std::to_string(statusCode) + " " + reason)
    , mStatusCode(statusCode)
    , mReason(reason)
    , mData(std::move(data)) {}

std::string reasonPhrase(int statusCode) {
    if (statusCode < 100 || statusCode > 999) {
        return "Unknown Status";
    }

    const auto status = http::int_to_status(static_cast<unsigned>(statusCode));
    if (status == http::status::unknown) {
        return "Unknown Status";
    }
    return std::string(http::obsolete_reason(status));
}

} // namespace resilient_http
