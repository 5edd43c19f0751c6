#pragma once

#include "models.hpp"
#include "options.hpp"
#include "transport.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>

namespace resilient_http {

/// Drives one logical request through the transport: retries rate-limited
/// responses and connection-reset class failures with exponential backoff,
/// fails fast on everything else, and reports exactly one outcome.
///
/// Configuration is captured at construction and never changes. Concurrent
/// calls are independent; each owns its own attempt counter and timer.
class RequestExecutor {
public:
    /// Transport invocations allowed per logical call.
    static constexpr int kMaxAttempts = 5;

    using CompletionHandler = std::function<void(Outcome)>;

    struct Stats {
        uint64_t requests  = 0;   // logical calls started
        uint64_t attempts  = 0;   // transport invocations
        uint64_t retries   = 0;   // backoff waits scheduled
        uint64_t successes = 0;
        uint64_t failures  = 0;
    };

    /// The executor itself must outlive every call started through it: pending
    /// timers and transport completions refer back to it.
    ///
    /// @param ioc        Context that runs transport completions and backoff timers.
    /// @param transport  Must outlive the executor and every call made through it.
    RequestExecutor(boost::asio::io_context& ioc,
                    Transport& transport,
                    ClientOptions options = {});

    /// Start a logical call. @p handler receives the response of the first
    /// successful attempt, or the terminal error. Called exactly once.
    void asyncExecute(const RequestDescriptor& descriptor, CompletionHandler handler);

    /// Future flavour of asyncExecute. get() throws HttpError or
    /// TransportError. The io_context must be running on another thread.
    std::future<Response> execute(const RequestDescriptor& descriptor);

    int                  maxAttempts() const { return kMaxAttempts; }
    const ClientOptions& options()     const { return mOptions; }
    Stats                stats()       const;

private:
    class Call;

    boost::asio::io_context& mIoc;
    Transport&               mTransport;
    const ClientOptions      mOptions;

    std::atomic<uint64_t> mRequests{0};
    std::atomic<uint64_t> mAttempts{0};
    std::atomic<uint64_t> mRetries{0};
    std::atomic<uint64_t> mSuccesses{0};
    std::atomic<uint64_t> mFailures{0};
};

} // namespace resilient_http
