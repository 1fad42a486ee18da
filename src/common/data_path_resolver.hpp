#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace scout::data {

// Returns the detected runtime data directory (SCOUT_DATA_DIR, then the build-time default).
const std::filesystem::path &DataRoot();

// Resolve paths located under the runtime data directory.
std::filesystem::path Resolve(const std::filesystem::path &relativePath);

std::optional<scout::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                               const std::string &label,
                                               spdlog::level::level_enum missingLevel);

std::filesystem::path UserConfigDirectory();
std::filesystem::path UserCacheDirectory();

// Creates the user cache directory when missing and returns the path of fileName inside it.
std::filesystem::path EnsureUserCacheFile(const std::string &fileName);

} // namespace scout::data
