#include "spdlog/spdlog.h"
#include "cache/cache_store_factory.hpp"
#include "catalog/catalog_client.hpp"
#include "catalog/curl_http_transport.hpp"
#include "cli/cli_options.hpp"
#include "common/config_store.hpp"
#include "common/data_path_resolver.hpp"
#include "common/logging.hpp"
#include "probe/a2s_probe_transport.hpp"
#include "probe/liveness_prober.hpp"
#include "refresh/refresh_orchestrator.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

std::string formatPing(const std::optional<int> &pingMs) {
    return pingMs ? std::to_string(*pingMs) + " ms" : std::string("-");
}

void printRecord(const char *label, const scout::ServerRecord &record) {
    std::cout << std::left << std::setw(9) << label << ' '
              << std::setw(22) << record.address.key() << ' '
              << std::setw(8) << formatPing(record.pingMs) << ' '
              << std::setw(8) << (std::to_string(record.playerCount) + "/" + std::to_string(record.maxPlayers)) << ' '
              << std::setw(10) << scout::SourceKindName(record.sourceKind) << ' '
              << std::setw(8) << scout::PerspectiveName(record.perspective) << ' '
              << record.name << '\n';
}

std::vector<std::string> splitCountryList(const std::vector<std::string> &values) {
    std::vector<std::string> codes;
    for (const auto &value : values) {
        std::stringstream stream(value);
        std::string code;
        while (std::getline(stream, code, ',')) {
            if (!code.empty()) {
                codes.push_back(code);
            }
        }
    }
    return codes;
}

bool buildCriteria(const ScoutCLIOptions &cliOptions, scout::FilterCriteria &criteria, std::string *error) {
    if (!cliOptions.region.empty()) {
        criteria.region = scout::ParseRegion(cliOptions.region);
        if (!criteria.region) {
            *error = "unknown region '" + cliOptions.region + "'";
            return false;
        }
    }
    if (!cliOptions.countries.empty()) {
        criteria.countries = splitCountryList(cliOptions.countries);
    }
    if (!cliOptions.serverType.empty()) {
        criteria.serverType = scout::ParseSourceKind(cliOptions.serverType);
        if (!criteria.serverType) {
            *error = "unknown server type '" + cliOptions.serverType + "'";
            return false;
        }
    }
    if (!cliOptions.search.empty()) {
        criteria.search = cliOptions.search;
    }
    criteria.mods = cliOptions.mods;
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    scout::log::ConfigureLogging(spdlog::level::info, false);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    ScoutCLIOptions cliOptions;
    try {
        cliOptions = ParseScoutCLIOptions(argc, argv);
    } catch (const std::exception &ex) {
        spdlog::error("Failed to parse command line options: {}", ex.what());
        return 2;
    }

    spdlog::level::level_enum level = cliOptions.verbose ? spdlog::level::trace : spdlog::level::info;
    if (cliOptions.logLevelExplicit) {
        level = scout::log::ParseLogLevel(cliOptions.logLevel);
    }
    scout::log::ConfigureLogging(level, cliOptions.timestampLogging);

    if (!cliOptions.dataDir.empty()) {
        setenv("SCOUT_DATA_DIR", cliOptions.dataDir.c_str(), 1);
    }

    const std::vector<scout::config::ConfigFileSpec> configSpecs = {
        {"config.json", "data/config.json", spdlog::level::err, true}
    };
    scout::config::ConfigStore::Initialize(configSpecs, cliOptions.userConfigPath);

    scout::RefreshOptions options = scout::RefreshOptions::FromConfig();
    if (cliOptions.limit) {
        options.catalogLimit = *cliOptions.limit;
    }
    if (cliOptions.concurrency) {
        options.concurrencyLimit = *cliOptions.concurrency;
    }
    if (cliOptions.timeoutMs) {
        options.probeTimeout = std::chrono::milliseconds(*cliOptions.timeoutMs);
    }
    if (!cliOptions.cachePath.empty()) {
        options.cachePath = cliOptions.cachePath;
    }

    std::string error;
    if (!options.validate(&error)) {
        spdlog::error("main: Invalid configuration: {}", error);
        return 2;
    }

    scout::FilterCriteria criteria;
    if (!buildCriteria(cliOptions, criteria, &error)) {
        spdlog::error("main: {}", error);
        return 2;
    }

    std::filesystem::path cachePath = options.cachePath;
    scout::cache::CacheBackend backend = cliOptions.memoryCache
        ? scout::cache::CacheBackend::Memory
        : scout::cache::CacheBackend::Sqlite;
    if (backend == scout::cache::CacheBackend::Sqlite && cachePath.empty()) {
        try {
            cachePath = scout::data::EnsureUserCacheFile("servers.db");
        } catch (const std::exception &ex) {
            spdlog::warn("main: {}; using in-memory cache", ex.what());
            backend = scout::cache::CacheBackend::Memory;
        }
    }

    bool degraded = false;
    auto cacheStore = scout::cache::CreateCacheStore(backend, cachePath, &degraded);

    if (cliOptions.top) {
        const auto sortKey = scout::cache::ParseSortKey(cliOptions.sortKey);
        if (!sortKey) {
            spdlog::error("main: Unknown sort key '{}'", cliOptions.sortKey);
            return 2;
        }
        try {
            for (const auto &record : cacheStore->getTopServers(*cliOptions.top, *sortKey)) {
                printRecord("CACHED", record);
            }
            cacheStore->close();
        } catch (const scout::cache::CacheError &ex) {
            spdlog::error("main: Cache read failed: {}", ex.what());
            return 1;
        }
        return 0;
    }

    scout::SystemClock clock;
    scout::catalog::CurlHttpTransport httpTransport(options.catalogTimeout);
    scout::catalog::CatalogClient catalogClient(options.catalog, httpTransport, clock);
    scout::probe::A2sProbeTransport probeTransport;
    scout::probe::LivenessProber prober(probeTransport);
    scout::UpdateStream stream;
    scout::RefreshOrchestrator orchestrator(options, catalogClient, std::move(cacheStore), prober, stream, clock);

    bool finished = false;
    bool failed = false;
    std::size_t reachable = 0;
    std::size_t unreachable = 0;
    stream.subscribe([&](const scout::UpdateEvent &event) {
        switch (event.type) {
            case scout::UpdateEventType::ServerUpdated:
                if (event.record) {
                    if (event.record->pingMs) {
                        ++reachable;
                    } else {
                        ++unreachable;
                    }
                    printRecord("UPDATED", *event.record);
                }
                break;
            case scout::UpdateEventType::PartialReady:
                std::cout << "-- partial results ready (" << reachable + unreachable << " probed)\n";
                break;
            case scout::UpdateEventType::Complete:
                finished = true;
                break;
            case scout::UpdateEventType::Failed:
                finished = true;
                failed = true;
                std::cout << "-- refresh failed (" << scout::ErrorKindName(event.failure.value_or(scout::ErrorKind::Network))
                          << "): " << event.message << '\n';
                break;
        }
    });

    scout::Error requestError;
    const auto generation = orchestrator.requestRefresh(criteria, cliOptions.force, &requestError);
    if (!generation) {
        spdlog::error("main: Refresh rejected ({}): {}", scout::ErrorKindName(requestError.kind), requestError.message);
        return 2;
    }

    while (!finished && g_running) {
        stream.waitForEvents(std::chrono::steady_clock::now() + std::chrono::milliseconds(200));
        stream.dispatch();
    }
    std::cout << std::flush;

    if (!g_running) {
        spdlog::info("Interrupted; shutting down");
    }
    orchestrator.shutdown();

    spdlog::info("main: {} reachable, {} unreachable{}", reachable, unreachable,
                 orchestrator.isDegraded() || degraded ? " (in-memory cache)" : "");
    return failed ? 1 : 0;
}
