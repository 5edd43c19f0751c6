#include "executor.hpp"
#include "backoff.hpp"
#include "classifier.hpp"
#include "envelope.hpp"
#include "normalizer.hpp"

#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <memory>
#include <type_traits>

namespace net = boost::asio;

namespace resilient_http {

// ---------------------------------------------------------------------------
// Call: state of one logical request
// ---------------------------------------------------------------------------

class RequestExecutor::Call : public std::enable_shared_from_this<Call> {
public:
    Call(RequestExecutor& exec, RequestEnvelope envelope, CompletionHandler handler)
        : mExec(exec)
        , mEnvelope(std::move(envelope))
        , mHandler(std::move(handler))
        , mTimer(exec.mIoc) {}

    void start() { attempt(); }

private:
    RequestExecutor&  mExec;
    const RequestEnvelope mEnvelope;
    CompletionHandler mHandler;
    net::steady_timer mTimer;
    int               mAttempt = 0;   // 0-based, only ever increases

    void attempt() {
        ++mExec.mAttempts;
        auto self = shared_from_this();
        mExec.mTransport.asyncAttempt(mEnvelope, [self](AttemptResult result) {
            self->onAttempt(std::move(result));
        });
    }

    void onAttempt(AttemptResult result) {
        const auto verdict = classify(result, mExec.mOptions.retryableCodes);

        switch (verdict) {
            case Verdict::Success:
                return succeed(std::get<Response>(std::move(result)));

            case Verdict::TerminalFailure:
                return fail(normalize(result));

            case Verdict::RetryableFailure:
                break;
        }

        ++mAttempt;
        if (mAttempt >= mExec.kMaxAttempts) {
            if (mExec.mOptions.verbose) {
                std::cerr << "[Retry] Giving up after " << mAttempt << " attempts\n";
            }
            return fail(normalize(result));
        }

        const auto delay = computeDelay(mAttempt,
                                        mExec.mOptions.retryMinDelay,
                                        mExec.mOptions.retryMaxDelay,
                                        mExec.mOptions.backoff);
        ++mExec.mRetries;

        if (mExec.mOptions.verbose) {
            std::cerr << "[Retry] " << describeAttempt(result)
                      << " - attempt " << mAttempt << "/" << mExec.kMaxAttempts
                      << ", backoff " << delay.count() << " ms\n";
        }

        auto self = shared_from_this();
        mTimer.expires_after(delay);
        mTimer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) {
                // Only reachable when the io_context tears the timer down.
                return self->fail(TransportError(
                    "Retry wait aborted: " + ec.message(), "ECANCELED"));
            }
            self->attempt();
        });
    }

    void succeed(Response response) {
        ++mExec.mSuccesses;
        complete(Outcome(std::in_place_type<Response>, std::move(response)));
    }

    void fail(TerminalError error) {
        ++mExec.mFailures;
        if (mExec.mOptions.verbose) {
            std::cerr << "[Executor] " << mEnvelope.method << " " << mEnvelope.uri
                      << " failed: " << describe(error) << "\n";
        }
        complete(Outcome(std::in_place_type<TerminalError>, std::move(error)));
    }

    void complete(Outcome outcome) {
        if (!mHandler) return;
        auto handler = std::move(mHandler);
        mHandler = nullptr;
        handler(std::move(outcome));
    }

    static std::string describeAttempt(const AttemptResult& result) {
        return std::visit(
            [](const auto& r) -> std::string {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, Response>) {
                    return "HTTP " + std::to_string(r.statusCode);
                } else {
                    return "Transport error " + r.code().value_or("(no code)") +
                           " (" + r.what() + ")";
                }
            },
            result);
    }
};

// ---------------------------------------------------------------------------
// RequestExecutor
// ---------------------------------------------------------------------------

RequestExecutor::RequestExecutor(net::io_context& ioc,
                                 Transport& transport,
                                 ClientOptions options)
    : mIoc(ioc)
    , mTransport(transport)
    , mOptions(std::move(options)) {}

void RequestExecutor::asyncExecute(const RequestDescriptor& descriptor,
                                   CompletionHandler handler) {
    ++mRequests;
    auto call = std::make_shared<Call>(*this, buildEnvelope(descriptor, mOptions),
                                       std::move(handler));
    call->start();
}

std::future<Response> RequestExecutor::execute(const RequestDescriptor& descriptor) {
    auto promise = std::make_shared<std::promise<Response>>();
    auto future  = promise->get_future();

    asyncExecute(descriptor, [promise](Outcome outcome) {
        if (auto* response = std::get_if<Response>(&outcome)) {
            promise->set_value(std::move(*response));
            return;
        }
        try {
            rethrow(std::get<TerminalError>(outcome));
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });
    return future;
}

RequestExecutor::Stats RequestExecutor::stats() const {
    Stats s;
    s.requests  = mRequests.load();
    s.attempts  = mAttempts.load();
    s.retries   = mRetries.load();
    s.successes = mSuccesses.load();
    s.failures  = mFailures.load();
    return s;
}

} // namespace resilient_http
