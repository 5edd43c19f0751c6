#include "beast_transport.hpp"
#include "envelope.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#ifdef RESILIENT_HTTP_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace resilient_http {

// ---------------------------------------------------------------------------
// Error mapping
// ---------------------------------------------------------------------------

std::optional<std::string> transportCode(const boost::system::error_code& ec) {
    if (!ec) return std::nullopt;

    if (ec == net::error::connection_reset)      return "ECONNRESET";
    if (ec == net::error::connection_aborted)    return "ECONNABORTED";
    if (ec == net::error::connection_refused)    return "ECONNREFUSED";
    if (ec == net::error::broken_pipe)           return "EPIPE";
    if (ec == net::error::timed_out)             return "ETIMEDOUT";
    if (ec == beast::error::timeout)             return "ETIMEDOUT";
    if (ec == net::error::host_not_found)        return "ENOTFOUND";
    if (ec == net::error::host_not_found_try_again) return "EAI_AGAIN";
    if (ec == net::error::network_unreachable)   return "ENETUNREACH";
    if (ec == net::error::host_unreachable)      return "EHOSTUNREACH";
    if (ec == net::error::operation_aborted)     return "ECANCELED";

    // Peer hung up before a complete response arrived.
    if (ec == net::error::eof)                   return "ECONNRESET";
    if (ec == http::error::end_of_stream)        return "ECONNRESET";
    if (ec == http::error::partial_message)      return "ECONNRESET";

    return std::nullopt;
}

namespace {

std::string toString(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// ---------------------------------------------------------------------------
// Session: one attempt over one connection
// ---------------------------------------------------------------------------

template <class Derived>
class Session {
public:
    Session(net::io_context& ioc,
            http::request<http::string_body> req,
            bool json,
            std::chrono::milliseconds timeout,
            Transport::AttemptHandler handler,
            bool verbose)
        : mResolver(net::make_strand(ioc))
        , mReq(std::move(req))
        , mJson(json)
        , mTimeout(timeout)
        , mHandler(std::move(handler))
        , mVerbose(verbose)
    {
        mParser.body_limit(std::numeric_limits<std::uint64_t>::max());
        if (mReq.method() == http::verb::head) {
            mParser.skip(true);
        }
    }

    void run(const std::string& host, const std::string& port) {
        auto self = derived().shared_from_this();
        mResolver.async_resolve(
            host, port,
            [self](beast::error_code ec, tcp::resolver::results_type results) {
                self->onResolve(ec, std::move(results));
            });
    }

protected:
    Derived& derived() { return static_cast<Derived&>(*this); }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");

        auto self = derived().shared_from_this();
        beast::get_lowest_layer(derived().stream()).expires_after(mTimeout);
        beast::get_lowest_layer(derived().stream()).async_connect(
            results,
            [self](beast::error_code ec, tcp::endpoint) {
                if (ec) return self->fail(ec, "connect");
                self->onConnect();
            });
    }

    void write() {
        auto self = derived().shared_from_this();
        beast::get_lowest_layer(derived().stream()).expires_after(mTimeout);
        http::async_write(
            derived().stream(), mReq,
            [self](beast::error_code ec, std::size_t) {
                if (ec) return self->fail(ec, "write");
                self->read();
            });
    }

    void read() {
        auto self = derived().shared_from_this();
        beast::get_lowest_layer(derived().stream()).expires_after(mTimeout);
        http::async_read(
            derived().stream(), mBuffer, mParser,
            [self](beast::error_code ec, std::size_t) {
                if (ec) return self->fail(ec, "read");
                self->onRead();
            });
    }

    void onRead() {
        const auto& res = mParser.get();

        Response response;
        response.statusCode = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            const auto name  = toString(field.name_string());
            const auto value = toString(field.value());
            auto it = response.headers.find(name);
            if (it == response.headers.end()) {
                response.headers.emplace(name, value);
            } else {
                it->second += ", " + value;
            }
        }
        response.body = parseBody(res.body(), mJson);

        if (mVerbose) {
            std::cerr << "[Transport] " << mReq.method_string() << " "
                      << mReq.target() << " -> HTTP "
                      << response.statusCode << "\n";
        }

        derived().close();
        complete(std::move(response));
    }

    void fail(beast::error_code ec, const char* what) {
        if (mVerbose) {
            std::cerr << "[Transport] " << what << " failed: "
                      << ec.message() << "\n";
        }
        derived().close();
        complete(TransportError(std::string(what) + ": " + ec.message(),
                                transportCode(ec)));
    }

    void complete(AttemptResult result) {
        if (!mHandler) return;
        auto handler = std::move(mHandler);
        mHandler = nullptr;
        handler(std::move(result));
    }

    tcp::resolver                              mResolver;
    http::request<http::string_body>           mReq;
    http::response_parser<http::string_body>   mParser;
    beast::flat_buffer                         mBuffer;
    bool                                       mJson;
    std::chrono::milliseconds                  mTimeout;
    Transport::AttemptHandler                  mHandler;
    bool                                       mVerbose;
};

class PlainSession : public Session<PlainSession>,
                     public std::enable_shared_from_this<PlainSession> {
public:
    template <class... Args>
    explicit PlainSession(net::io_context& ioc, Args&&... args)
        : Session<PlainSession>(ioc, std::forward<Args>(args)...)
        , mStream(mResolver.get_executor()) {}

    beast::tcp_stream& stream() { return mStream; }

    void onConnect() { write(); }

    void close() {
        // Non-critical errors on shutdown are ignored.
        beast::error_code ec;
        mStream.socket().shutdown(tcp::socket::shutdown_both, ec);
        mStream.close();
    }

private:
    beast::tcp_stream mStream;
};

#ifdef RESILIENT_HTTP_HAS_SSL
class TlsSession : public Session<TlsSession>,
                   public std::enable_shared_from_this<TlsSession> {
public:
    template <class... Args>
    TlsSession(net::io_context& ioc, net::ssl::context& ctx, std::string host, Args&&... args)
        : Session<TlsSession>(ioc, std::forward<Args>(args)...)
        , mStream(mResolver.get_executor(), ctx)
        , mHost(std::move(host)) {}

    beast::ssl_stream<beast::tcp_stream>& stream() { return mStream; }

    void onConnect() {
        // SNI hostname.
        if (!SSL_set_tlsext_host_name(mStream.native_handle(), mHost.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()),
                                 net::error::get_ssl_category()};
            return fail(ec, "handshake");
        }

        auto self = shared_from_this();
        beast::get_lowest_layer(mStream).expires_after(mTimeout);
        mStream.async_handshake(
            net::ssl::stream_base::client,
            [self](beast::error_code ec) {
                if (ec) return self->fail(ec, "handshake");
                self->write();
            });
    }

    void close() {
        beast::get_lowest_layer(mStream).close();
    }

private:
    beast::ssl_stream<beast::tcp_stream> mStream;
    std::string                          mHost;
};
#endif

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(net::io_context& ioc, bool verbose)
    : mIoc(ioc)
    , mVerbose(verbose)
#ifdef RESILIENT_HTTP_HAS_SSL
    , mSslCtx(net::ssl::context::tlsv12_client)
#endif
{
#ifdef RESILIENT_HTTP_HAS_SSL
    mSslCtx.set_default_verify_paths();
    mSslCtx.set_verify_mode(net::ssl::verify_peer);
#endif
}

// ---------------------------------------------------------------------------
// Request validation
// ---------------------------------------------------------------------------

namespace {

constexpr std::size_t kMaxHeaderNameSize  = 256;
constexpr std::size_t kMaxHeaderValueSize = 16 * 1024;

// RFC 7230 tchar.
bool isTokenChar(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'':
        case '*': case '+': case '-': case '.': case '^': case '_':
        case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool isToken(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return isTokenChar(c); });
}

// Field values may not break out of their line.
bool isSafeFieldValue(const std::string& s) {
    return s.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

/// Empty string when the method and headers can go on the wire as given,
/// otherwise the reason they cannot.
std::string requestProblem(const RequestEnvelope& envelope) {
    if (envelope.method.empty()) {
        return "missing method";
    }
    if (!isToken(envelope.method)) {
        return "malformed method '" + envelope.method + "'";
    }
    for (const auto& [name, value] : envelope.headers) {
        if (!isToken(name) || name.size() > kMaxHeaderNameSize) {
            return "malformed header name '" + name.substr(0, 64) + "'";
        }
        if (!isSafeFieldValue(value)) {
            return "header '" + name + "' contains CR, LF or NUL";
        }
        if (value.size() > kMaxHeaderValueSize) {
            return "header '" + name + "' exceeds " +
                   std::to_string(kMaxHeaderValueSize) + " bytes";
        }
    }
    return {};
}

http::request<http::string_body> makeRequest(const RequestEnvelope& envelope,
                                             const UrlParts& parts) {
    http::request<http::string_body> req;
    const auto verb = http::string_to_verb(envelope.method);
    if (verb == http::verb::unknown) {
        req.method_string(envelope.method);
    } else {
        req.method(verb);
    }
    req.target(parts.target);
    req.version(11);

    const bool defaultPort = (parts.scheme == "https" && parts.port == "443") ||
                             (parts.scheme == "http" && parts.port == "80");
    req.set(http::field::host, defaultPort ? parts.host : parts.host + ":" + parts.port);
    for (const auto& [key, value] : envelope.headers) {
        req.set(key, value);
    }

    if (envelope.body.has_value()) {
        if (envelope.json && !hasHeader(envelope.headers, "Content-Type")) {
            req.set(http::field::content_type, "application/json");
        }
        req.body() = serializeBody(*envelope.body);
    }
    req.prepare_payload();
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void BeastTransport::asyncAttempt(const RequestEnvelope& envelope,
                                  AttemptHandler handler) {
    const auto problem = requestProblem(envelope);
    if (!problem.empty()) {
        return failNow(std::move(handler),
                       TransportError("Invalid request: " + problem, "EINVAL"));
    }

    UrlParts parts;
    try {
        parts = parseUrl(envelope.uri);
    } catch (const std::invalid_argument& e) {
        return failNow(std::move(handler), TransportError(e.what(), "EINVAL"));
    }
    if (!isSafeFieldValue(parts.host) ||
        parts.host.find_first_of(" \t") != std::string::npos) {
        return failNow(std::move(handler),
                       TransportError("Invalid URL (malformed host): " + envelope.uri,
                                      "EINVAL"));
    }

    // Beast reports oversized or malformed fields by throwing.
    http::request<http::string_body> req;
    try {
        req = makeRequest(envelope, parts);
    } catch (const std::exception& e) {
        return failNow(std::move(handler),
                       TransportError(std::string("Invalid request: ") + e.what(), "EINVAL"));
    }

    if (mVerbose) {
        std::cerr << "[Transport] " << req.method_string() << " "
                  << parts.host << ":" << parts.port << parts.target << "\n";
    }

    if (parts.scheme == "https") {
#ifdef RESILIENT_HTTP_HAS_SSL
        std::make_shared<TlsSession>(mIoc, mSslCtx, parts.host, std::move(req),
                                     envelope.json, envelope.timeout,
                                     std::move(handler), mVerbose)
            ->run(parts.host, parts.port);
#else
        failNow(std::move(handler),
                TransportError("HTTPS not supported: built without OpenSSL",
                               "EPROTONOSUPPORT"));
#endif
        return;
    }

    std::make_shared<PlainSession>(mIoc, std::move(req), envelope.json,
                                   envelope.timeout, std::move(handler), mVerbose)
        ->run(parts.host, parts.port);
}

void BeastTransport::failNow(AttemptHandler handler, TransportError error) {
    if (mVerbose) {
        std::cerr << "[Transport] Rejected before sending: " << error.what() << "\n";
    }
    // Keep the one-callback-per-attempt contract asynchronous.
    net::post(mIoc, [handler = std::move(handler), error = std::move(error)]() mutable {
        handler(std::move(error));
    });
}

} // namespace resilient_http
