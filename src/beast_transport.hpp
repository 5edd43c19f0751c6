#pragma once

#include "transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#ifdef RESILIENT_HTTP_HAS_SSL
#include <boost/asio/ssl/context.hpp>
#endif

#include <optional>
#include <string>

namespace resilient_http {

/// Asynchronous HTTP/1.1 transport built on Boost.Beast.
/// One connection per attempt: resolve, connect, (handshake,) write, read.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(boost::asio::io_context& ioc, bool verbose = false);

    void asyncAttempt(const RequestEnvelope& envelope,
                      AttemptHandler handler) override;

private:
    boost::asio::io_context& mIoc;
    bool                     mVerbose;

#ifdef RESILIENT_HTTP_HAS_SSL
    boost::asio::ssl::context mSslCtx;
#endif

    void failNow(AttemptHandler handler, TransportError error);
};

/// Map a Boost/Beast error to a POSIX-style transport code
/// ("ECONNRESET", "ETIMEDOUT", ...). Unknown errors map to nullopt.
std::optional<std::string> transportCode(const boost::system::error_code& ec);

} // namespace resilient_http
