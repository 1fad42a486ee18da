#include "cli/cli_options.hpp"

#include "common/logging.hpp"
#include "cxxopts.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ScoutCLIOptions ParseScoutCLIOptions(int argc, char *argv[]) {
    cxxopts::Options options("scout", "Discover and probe game servers");
    options.add_options()
        ("r,region", "Region filter (europe, north_america, oceania)", cxxopts::value<std::string>())
        ("countries", "Comma-separated country codes (wins over --region)", cxxopts::value<std::vector<std::string>>())
        ("t,type", "Server type (official, community, private)", cxxopts::value<std::string>())
        ("s,search", "Free-text search on server name", cxxopts::value<std::string>())
        ("mods", "Only servers with mods")
        ("no-mods", "Only servers without mods")
        ("f,force", "Ignore the cache TTL and fetch from the catalog")
        ("l,limit", "Maximum number of catalog records", cxxopts::value<std::size_t>())
        ("concurrency", "Maximum probes in flight", cxxopts::value<std::size_t>())
        ("timeout-ms", "Per-probe timeout in milliseconds", cxxopts::value<int>())
        ("cache", "Cache database path", cxxopts::value<std::string>())
        ("memory-cache", "Keep the cache in memory only")
        ("top", "Print the N top cached servers and exit", cxxopts::value<std::size_t>())
        ("sort", "Sort key for --top (players, ping, name, last_seen)", cxxopts::value<std::string>()->default_value("players"))
        ("d,data-dir", "Data directory (overrides SCOUT_DATA_DIR)", cxxopts::value<std::string>())
        ("c,config", "User config file path", cxxopts::value<std::string>())
        ("v,verbose", "Enable verbose logging")
        ("L,log-level", "Logging level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>())
        ("timestamp-logging", "Include timestamps in console logs")
        ("h,help", "Show help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    ScoutCLIOptions parsed;
    if (result.count("mods") && result.count("no-mods")) {
        throw std::runtime_error("Cannot specify both --mods and --no-mods");
    }
    if (result.count("mods")) {
        parsed.mods = true;
    } else if (result.count("no-mods")) {
        parsed.mods = false;
    }

    parsed.region = result.count("region") ? result["region"].as<std::string>() : std::string();
    if (result.count("countries")) {
        parsed.countries = result["countries"].as<std::vector<std::string>>();
    }
    parsed.serverType = result.count("type") ? result["type"].as<std::string>() : std::string();
    parsed.search = result.count("search") ? result["search"].as<std::string>() : std::string();
    parsed.force = result.count("force") > 0;
    if (result.count("limit")) {
        parsed.limit = result["limit"].as<std::size_t>();
    }
    if (result.count("concurrency")) {
        parsed.concurrency = result["concurrency"].as<std::size_t>();
    }
    if (result.count("timeout-ms")) {
        parsed.timeoutMs = result["timeout-ms"].as<int>();
    }
    parsed.cachePath = result.count("cache") ? result["cache"].as<std::string>() : std::string();
    parsed.memoryCache = result.count("memory-cache") > 0;
    if (result.count("top")) {
        parsed.top = result["top"].as<std::size_t>();
    }
    parsed.sortKey = result["sort"].as<std::string>();
    parsed.dataDir = result.count("data-dir") ? result["data-dir"].as<std::string>() : std::string();
    parsed.userConfigPath = result.count("config") ? result["config"].as<std::string>() : std::string();
    parsed.verbose = result.count("verbose") > 0;
    parsed.timestampLogging = result.count("timestamp-logging") > 0;
    if (result.count("log-level")) {
        parsed.logLevel = result["log-level"].as<std::string>();
        parsed.logLevelExplicit = true;
        if (!scout::log::IsValidLogLevel(parsed.logLevel)) {
            throw std::runtime_error("Invalid --log-level '" + parsed.logLevel + "'");
        }
    }
    return parsed;
}
