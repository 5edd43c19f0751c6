#include "envelope.hpp"
#include "util.hpp"

#include <boost/config.hpp>
#include <boost/version.hpp>

namespace resilient_http {

bool hasHeader(const HeaderMap& headers, const std::string& name) {
    const auto wanted = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == wanted) return true;
    }
    return false;
}

HeaderMap defaultHeaders() {
    return {
        {"User-Agent",        "resilient_http/" + kVersion},
        {"X-Client-Platform", BOOST_PLATFORM},
        {"X-Client-Runtime",  std::string(BOOST_COMPILER) + "; boost " + BOOST_LIB_VERSION},
    };
}

RequestEnvelope buildEnvelope(const RequestDescriptor& descriptor,
                              const ClientOptions& options) {
    RequestEnvelope env;
    env.method  = descriptor.method;
    env.uri     = descriptor.uri;
    env.json    = !options.disableAutomaticJson;
    env.body    = descriptor.body;
    env.timeout = options.timeout;

    if (options.disableCustomHeaders) {
        env.headers = descriptor.headers;
    } else {
        for (const auto& [key, value] : defaultHeaders()) {
            if (!hasHeader(descriptor.headers, key)) {
                env.headers.emplace(key, value);
            }
        }
        for (const auto& [key, value] : descriptor.headers) {
            env.headers[key] = value;
        }
    }

    // --- JSON mode ---
    if (env.json && !options.disableCustomHeaders &&
        !hasHeader(env.headers, "Accept")) {
        env.headers.emplace("Accept", "application/json");
    }
    return env;
}

nlohmann::json parseBody(const std::string& text, bool json) {
    if (!json) {
        return text;
    }
    if (text.empty()) {
        return nullptr;
    }

    // Unparsable text is kept as a string.
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return text;
    }
    return parsed;
}

std::string serializeBody(const nlohmann::json& body) {
    if (body.is_string()) {
        return body.get<std::string>();
    }
    return body.dump();
}

} // namespace resilient_http
