#include "classifier.hpp"

#include <type_traits>

namespace resilient_http {

namespace {

constexpr int kFirstErrorStatus     = 400;
constexpr int kTooManyRequestsStatus = 429;

} // namespace

std::ostream& operator<<(std::ostream& os, Verdict verdict) {
    switch (verdict) {
        case Verdict::Success:          return os << "success";
        case Verdict::RetryableFailure: return os << "retryable";
        case Verdict::TerminalFailure:  return os << "terminal";
    }
    return os << "unknown(" << static_cast<int>(verdict) << ")";
}

bool isRetryableTransportError(const TransportError& error,
                               const std::set<std::string>& retryableCodes) {
    const auto& code = error.code();
    return code.has_value() && retryableCodes.count(*code) > 0;
}

Verdict classify(const AttemptResult& result,
                 const std::set<std::string>& retryableCodes) {
    return std::visit(
        [&](const auto& r) -> Verdict {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, Response>) {
                if (r.statusCode < kFirstErrorStatus)       return Verdict::Success;
                if (r.statusCode == kTooManyRequestsStatus) return Verdict::RetryableFailure;
                return Verdict::TerminalFailure;
            } else {
                return isRetryableTransportError(r, retryableCodes)
                    ? Verdict::RetryableFailure
                    : Verdict::TerminalFailure;
            }
        },
        result);
}

} // namespace resilient_http
