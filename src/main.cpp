#include "config.hpp"
#include "endpoints.hpp"
#include "http_transport.hpp"
#include "request_executor.hpp"
#include "session_controller.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

struct Options {
    std::string                configPath;
    std::string                endpoint;
    std::string                version   = "v1.0";
    int                        top       = msgraph_sync::endpoints::kDefaultTopParam;
    std::optional<std::string> orderBy;
    std::optional<std::string> filter;
    int                        timeoutMs = 30000;
    bool                       verbose   = false;
};

static void printUsage() {
    std::cout
        << "Usage: msgraph_fetch --config FILE --endpoint PATH [options]\n\n"
        << "Options:\n"
        << "  --config FILE    JSON file with client_id, client_secret, tenant_id\n"
        << "                   and optional user_agent\n"
        << "  --endpoint PATH  Graph resource path, e.g. \"users\" or \"groups\"\n"
        << "  --version V      Graph API version: v1.0 or beta (default: v1.0)\n"
        << "  --top N          Page-size hint, 0 to omit   (default: 500)\n"
        << "  --orderby EXPR   $orderby expression\n"
        << "  --filter EXPR    $filter expression\n"
        << "  --timeout-ms N   HTTP timeout in ms          (default: 30000)\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --help, -h       Show this message\n";
}

static Options parseArgs(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--config") && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if ((arg == "--endpoint") && i + 1 < argc) {
            opts.endpoint = argv[++i];
        } else if ((arg == "--version") && i + 1 < argc) {
            opts.version = argv[++i];
        } else if ((arg == "--top") && i + 1 < argc) {
            opts.top = std::stoi(argv[++i]);
        } else if ((arg == "--orderby") && i + 1 < argc) {
            opts.orderBy = argv[++i];
        } else if ((arg == "--filter") && i + 1 < argc) {
            opts.filter = argv[++i];
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            opts.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (opts.configPath.empty() || opts.endpoint.empty()) {
        std::cerr << "--config and --endpoint are required\n\n";
        printUsage();
        std::exit(1);
    }
    return opts;
}

int main(int argc, char* argv[]) {
    using namespace msgraph_sync;

    try {
        Options opts = parseArgs(argc, argv);

        const auto version = parseGraphVersion(opts.version);
        auto config        = loadConfigFile(opts.configPath);

        std::cerr
            << "=== msgraph_fetch ===\n"
            << "Endpoint:   " << toString(version) << "/" << opts.endpoint << "\n"
            << "Top:        " << opts.top       << "\n"
            << "Timeout:    " << opts.timeoutMs << " ms\n"
            << "Verbose:    " << (opts.verbose ? "yes" : "no") << "\n"
            << "=====================\n\n";

        auto transport = std::make_unique<BeastTransport>(opts.timeoutMs);
        transport->setVerbose(opts.verbose);

        ClientContext context;
        context.transport = std::move(transport);
        context.verbose   = opts.verbose;

        SessionController session(std::move(config), std::move(context));
        session.login();

        FetchOptions fetch;
        fetch.top     = opts.top;
        fetch.orderBy = opts.orderBy;
        fetch.filter  = opts.filter;

        const auto records = session.fetchAll(version, opts.endpoint, fetch);

        for (const auto& record : records) {
            std::cout << record.dump() << "\n";
        }

        const auto stats = session.getStats();
        std::cerr
            << "\n=== Summary Report ===\n"
            << "Total fetched:       " << stats.totalFetched  << "\n"
            << "Total requests:      " << stats.totalRequests << "\n"
            << "Total retries:       " << stats.totalRetries  << "\n"
            << "Total pages:         " << stats.totalPages    << "\n"
            << "Total logins:        " << stats.totalLogins   << "\n"
            << "======================\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
