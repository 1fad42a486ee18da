#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace scout::config {

struct ConfigFileSpec {
    std::filesystem::path path;
    std::string label;
    spdlog::level::level_enum missingLevel = spdlog::level::warn;
    bool required = false;
    bool resolveRelativeToDataRoot = true;
};

// Process-wide read-only configuration addressed by dotted paths
// ("probe.TimeoutMs"). Values in the user layer override the defaults.
class ConfigStore {
public:
    // Loads the default layers and the user layer from disk. An empty userConfigPath
    // selects config.json under the user config directory.
    static void Initialize(const std::vector<ConfigFileSpec> &defaultSpecs,
                           const std::filesystem::path &userConfigPath);
    // Installs already-parsed layers.
    static void InitializeFromValues(scout::json::Value defaults, scout::json::Value user);
    static bool Initialized();

    // Returns nullptr when the store is uninitialized or the path does not resolve.
    static const scout::json::Value *Get(std::string_view path);
};

} // namespace scout::config
