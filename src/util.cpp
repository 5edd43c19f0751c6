#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace resilient_http {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme '" + parts.scheme + "': " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() != '/') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // Fragments never go on the wire.
    auto hash = parts.target.find('#');
    if (hash != std::string::npos) {
        parts.target.erase(hash);
    }

    // --- host / port ---
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

} // namespace resilient_http
