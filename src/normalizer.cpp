#include "normalizer.hpp"

#include <type_traits>

namespace resilient_http {

HttpError normalizeHttpFailure(const Response& response) {
    return HttpError(response.statusCode,
                     reasonPhrase(response.statusCode),
                     response.body);
}

TerminalError normalize(const AttemptResult& result) {
    return std::visit(
        [](const auto& r) -> TerminalError {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, Response>) {
                return normalizeHttpFailure(r);
            } else {
                return r;
            }
        },
        result);
}

void rethrow(const TerminalError& error) {
    std::visit([](const auto& e) { throw e; }, error);
    throw std::logic_error("rethrow: empty TerminalError");
}

std::string describe(const TerminalError& error) {
    return std::visit([](const auto& e) { return std::string(e.what()); }, error);
}

} // namespace resilient_http
