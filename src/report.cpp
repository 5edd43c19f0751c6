#include "report.hpp"

#include <type_traits>
#include <variant>

namespace resilient_http {

nlohmann::json toJson(const Response& response) {
    return {
        {"statusCode", response.statusCode},
        {"headers",    response.headers},
        {"body",       response.body},
    };
}

nlohmann::json toJson(const TerminalError& error) {
    return std::visit(
        [](const auto& e) -> nlohmann::json {
            nlohmann::json j;
            j["message"]     = e.what();
            j["isHttpError"] = e.isHttpError();
            if constexpr (std::is_same_v<std::decay_t<decltype(e)>, HttpError>) {
                j["statusCode"] = e.statusCode();
                j["data"]       = e.data();
            } else {
                if (e.code()) j["code"] = *e.code();
            }
            return j;
        },
        error);
}

std::string renderJson(const nlohmann::json& report) {
    return report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace resilient_http
