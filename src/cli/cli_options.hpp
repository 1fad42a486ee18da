#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct ScoutCLIOptions {
    std::string region;
    std::vector<std::string> countries;
    std::string serverType;
    std::string search;
    std::optional<bool> mods;
    bool force = false;
    std::optional<std::size_t> limit;
    std::optional<std::size_t> concurrency;
    std::optional<int> timeoutMs;
    std::string cachePath;
    bool memoryCache = false;
    std::optional<std::size_t> top;
    std::string sortKey = "players";
    std::string dataDir;
    std::string userConfigPath;
    bool verbose = false;
    std::string logLevel;
    bool logLevelExplicit = false;
    bool timestampLogging = false;
};

ScoutCLIOptions ParseScoutCLIOptions(int argc, char *argv[]);
