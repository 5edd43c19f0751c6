#include "beast_transport.hpp"
#include "envelope.hpp"
#include "executor.hpp"
#include "models.hpp"
#include "report.hpp"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

struct Config {
    std::string                    method    = "GET";
    std::string                    uri;
    resilient_http::HeaderMap      headers;
    std::optional<nlohmann::json>  data;
    resilient_http::ClientOptions  options;
};

static void printUsage() {
    std::cout
        << "Usage: resilient_http --uri URL [options]\n\n"
        << "Options:\n"
        << "  --method M                 HTTP method             (default: GET)\n"
        << "  --uri URL                  Request URL (required)\n"
        << "  --header 'Name: value'     Extra request header (repeatable)\n"
        << "  --data BODY                Request body (JSON, or text with\n"
        << "                             --disable-automatic-json)\n"
        << "  --disable-custom-headers   Do not send default headers\n"
        << "  --disable-automatic-json   Send and receive raw text\n"
        << "  --retry-min-delay-ms N     Backoff floor             (default: 1000)\n"
        << "  --retry-max-delay-ms N     Backoff ceiling           (default: 30000)\n"
        << "  --timeout-ms N             Per-attempt timeout       (default: 30000)\n"
        << "  --verbose                  Enable verbose diagnostics\n"
        << "  --help, -h                 Show this message\n";
}

static std::pair<std::string, std::string> parseHeader(const std::string& raw) {
    auto colon = raw.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::invalid_argument("Invalid header (expected 'Name: value'): " + raw);
    }
    std::string value = raw.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    return {raw.substr(0, colon), value};
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    std::optional<std::string> rawData;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--method" && i + 1 < argc) {
            cfg.method = argv[++i];
        } else if (arg == "--uri" && i + 1 < argc) {
            cfg.uri = argv[++i];
        } else if (arg == "--header" && i + 1 < argc) {
            auto [name, value] = parseHeader(argv[++i]);
            cfg.headers[name] = value;
        } else if (arg == "--data" && i + 1 < argc) {
            rawData = argv[++i];
        } else if (arg == "--disable-custom-headers") {
            cfg.options.disableCustomHeaders = true;
        } else if (arg == "--disable-automatic-json") {
            cfg.options.disableAutomaticJson = true;
        } else if (arg == "--retry-min-delay-ms" && i + 1 < argc) {
            cfg.options.retryMinDelay = std::chrono::milliseconds(std::stoll(argv[++i]));
        } else if (arg == "--retry-max-delay-ms" && i + 1 < argc) {
            cfg.options.retryMaxDelay = std::chrono::milliseconds(std::stoll(argv[++i]));
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            cfg.options.timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
        } else if (arg == "--verbose") {
            cfg.options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.uri.empty()) {
        std::cerr << "Missing required --uri\n\n";
        printUsage();
        std::exit(1);
    }

    // JSON mode sends parsed documents; text mode sends the bytes as given.
    if (rawData) {
        cfg.data = cfg.options.disableAutomaticJson
            ? nlohmann::json(*rawData)
            : nlohmann::json::parse(*rawData);
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        boost::asio::io_context ioc;
        resilient_http::BeastTransport transport(ioc, cfg.options.verbose);
        resilient_http::RequestExecutor executor(ioc, transport, cfg.options);

        if (executor.options().verbose) {
            const auto& opts = executor.options();
            std::cerr
                << "=== resilient_http " << resilient_http::kVersion << " ===\n"
                << "Request:    " << cfg.method << " " << cfg.uri << "\n"
                << "Retry:      " << executor.maxAttempts()
                << " attempts, backoff " << opts.retryMinDelay.count()
                << ".." << opts.retryMaxDelay.count() << " ms\n"
                << "Timeout:    " << opts.timeout.count() << " ms\n"
                << "====================\n\n";
        }

        resilient_http::RequestDescriptor request;
        request.method  = cfg.method;
        request.uri     = cfg.uri;
        request.headers = cfg.headers;
        request.body    = cfg.data;

        int exitCode = 1;
        executor.asyncExecute(request, [&](resilient_http::Outcome outcome) {
            if (auto* response = std::get_if<resilient_http::Response>(&outcome)) {
                std::cout << resilient_http::renderJson(resilient_http::toJson(*response))
                          << "\n";
                exitCode = 0;
            } else {
                std::cout << resilient_http::renderJson(resilient_http::toJson(
                                 std::get<resilient_http::TerminalError>(outcome)))
                          << "\n";
                exitCode = 2;
            }
        });
        ioc.run();

        if (cfg.options.verbose) {
            const auto stats = executor.stats();
            std::cerr
                << "\n=== Summary Report ===\n"
                << "Attempts:   " << stats.attempts << "\n"
                << "Retries:    " << stats.retries  << "\n"
                << "======================\n";
        }
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
