#include "catalog_store.hpp"
#include "confirm.hpp"
#include "http_client.hpp"
#include "merge.hpp"
#include "product_api.hpp"
#include "transport.hpp"
#include "upload.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

struct Config {
    std::string command;
    std::string catalogPath = "products.json";
    std::string apiBase     = "https://apis.roblox.com";
    int         pageSize    = 100;
    int         maxRetries  = 5;
    int         timeoutMs   = 30000;
    uint64_t    universeId  = 0;
    bool        overwrite   = false;
    bool        yes         = false;
    bool        verbose     = false;
};

static void printUsage() {
    std::cout
        << "Usage: product_sync [options] <command>\n\n"
        << "Commands:\n"
        << "  init             Create the products file\n"
        << "  download         Download all products from the universe\n"
        << "  sync             Sync products between file and universe\n\n"
        << "Options:\n"
        << "  --catalog PATH   Products file              (default: products.json)\n"
        << "  -o, --overwrite  Remote wins on download; push all diffs on sync\n"
        << "  -y, --yes        Answer yes to every prompt\n"
        << "  --api-base URL   Open Cloud base URL        "
           "(default: https://apis.roblox.com)\n"
        << "  --page-size N    Items per list request     (default: 100)\n"
        << "  --max-retries N  Rate-limit retries         (default: 5)\n"
        << "  --timeout-ms N   HTTP timeout in ms         (default: 30000)\n"
        << "  --universe-id N  Universe id for init       (default: 0)\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --help, -h       Show this message\n\n"
        << "The API key is read from RBX_API_KEY (a .env file is honoured).\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--catalog") && i + 1 < argc) {
            cfg.catalogPath = argv[++i];
        } else if ((arg == "--api-base") && i + 1 < argc) {
            cfg.apiBase = argv[++i];
        } else if ((arg == "--page-size") && i + 1 < argc) {
            cfg.pageSize = std::stoi(argv[++i]);
        } else if ((arg == "--max-retries") && i + 1 < argc) {
            cfg.maxRetries = std::stoi(argv[++i]);
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--universe-id") && i + 1 < argc) {
            cfg.universeId = std::stoull(argv[++i]);
        } else if (arg == "-o" || arg == "--overwrite") {
            cfg.overwrite = true;
        } else if (arg == "-y" || arg == "--yes") {
            cfg.yes = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (cfg.command.empty() &&
                   (arg == "init" || arg == "download" || arg == "sync")) {
            cfg.command = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.command.empty()) {
        std::cerr << "No command provided. Use --help for more information.\n";
        std::exit(1);
    }
    return cfg;
}

static void printTransportStats(const product_sync::RateLimitedTransport& transport) {
    std::cout
        << "HTTP requests:       " << transport.totalRequests() << "\n"
        << "Rate-limit retries:  " << transport.totalRetries()  << "\n"
        << "Total backoff (s):   " << std::fixed << std::setprecision(2)
                                   << transport.totalSleepSeconds() << "\n"
        << "======================\n";
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        product_sync::CatalogStore store(cfg.catalogPath);

        if (cfg.command == "init") {
            store.init(cfg.universeId);
            std::cout << cfg.catalogPath << " initialized successfully.\n";
            return 0;
        }

        product_sync::loadDotEnv(".env");

        product_sync::ApiCredential credential;
        if (const char* token = std::getenv("RBX_API_KEY")) {
            credential.set(std::string(token));
        } else {
            std::cerr << "[Config] RBX_API_KEY is not set; requests are unauthenticated\n";
        }

        product_sync::ClientConfig client;
        client.apiBase    = cfg.apiBase;
        client.timeoutMs  = cfg.timeoutMs;
        client.maxRetries = cfg.maxRetries;

        product_sync::BeastHttpSender sender(client.userAgent, client.timeoutMs);
        sender.setVerbose(cfg.verbose);
        product_sync::RateLimitedTransport transport(sender, credential, client);
        product_sync::RobloxProductApi api(transport, client, cfg.pageSize, cfg.verbose);

        if (cfg.command == "download") {
            product_sync::Downloader downloader(api, store, cfg.verbose);
            downloader.download(cfg.overwrite);

            const auto stats = downloader.getStats();
            std::cout
                << "\n=== Download Report ===\n"
                << "Local products:      " << stats.localProducts  << "\n"
                << "Remote products:     " << stats.remoteProducts << "\n"
                << "Matched:             " << stats.matched        << "\n"
                << "New:                 " << stats.added          << "\n";
            printTransportStats(transport);
            return 0;
        }

        std::unique_ptr<product_sync::Confirmer> confirmer;
        if (cfg.yes) {
            confirmer = std::make_unique<product_sync::AutoConfirmer>();
        } else {
            confirmer = std::make_unique<product_sync::ConsoleConfirmer>(std::cin, std::cout);
        }

        product_sync::Uploader uploader(api, store, *confirmer, cfg.verbose);
        uploader.upload(cfg.overwrite);

        const auto stats = uploader.getStats();
        std::cout
            << "\n=== Sync Report ===\n"
            << "Local products:      " << stats.localProducts  << "\n"
            << "Remote products:     " << stats.remoteProducts << "\n"
            << "Created:             " << stats.created        << "\n"
            << "Create failures:     " << stats.createFailed   << "\n"
            << "Updated:             " << stats.updated        << "\n";
        printTransportStats(transport);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
