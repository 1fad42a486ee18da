#include "common/data_path_resolver.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#ifndef SCOUT_DEFAULT_DATA_DIR
#define SCOUT_DEFAULT_DATA_DIR "data"
#endif

namespace {

std::filesystem::path TryCanonical(const std::filesystem::path &path) {
    std::error_code ec;
    auto result = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return result;
    }
    result = std::filesystem::absolute(path, ec);
    if (!ec) {
        return result;
    }
    return path;
}

std::filesystem::path userBaseDirectory(const char *xdgVariable, const char *homeSuffix) {
    std::filesystem::path base;
#if defined(_WIN32)
    (void)xdgVariable;
    (void)homeSuffix;
    if (const char *localAppData = std::getenv("LOCALAPPDATA"); localAppData && *localAppData) {
        base = localAppData;
    } else if (const char *appData = std::getenv("APPDATA"); appData && *appData) {
        base = appData;
    }
#else
    if (const char *xdg = std::getenv(xdgVariable); xdg && *xdg) {
        base = xdg;
    } else if (const char *home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / homeSuffix;
    }
#endif
    if (base.empty()) {
        throw std::runtime_error("Unable to determine user directory: no home path detected");
    }
    return TryCanonical(base / "serverscout");
}

} // namespace

namespace scout::data {

const std::filesystem::path &DataRoot() {
    static const std::filesystem::path root = [] {
        if (const char *envDataDir = std::getenv("SCOUT_DATA_DIR"); envDataDir && *envDataDir) {
            return TryCanonical(envDataDir);
        }
        return TryCanonical(SCOUT_DEFAULT_DATA_DIR);
    }();
    return root;
}

std::filesystem::path Resolve(const std::filesystem::path &relativePath) {
    if (relativePath.is_absolute()) {
        return relativePath;
    }
    return TryCanonical(DataRoot() / relativePath);
}

std::optional<scout::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                               const std::string &label,
                                               spdlog::level::level_enum missingLevel) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::log(missingLevel, "data_path_resolver: {} not found at {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::warn("data_path_resolver: Unable to open {} at {}", label, path.string());
        return std::nullopt;
    }

    try {
        return scout::json::Value::parse(stream);
    } catch (const std::exception &ex) {
        spdlog::warn("data_path_resolver: Failed to parse {} ({}): {}", label, path.string(), ex.what());
        return std::nullopt;
    }
}

std::filesystem::path UserConfigDirectory() {
    static const std::filesystem::path dir = userBaseDirectory("XDG_CONFIG_HOME", ".config");
    return dir;
}

std::filesystem::path UserCacheDirectory() {
    static const std::filesystem::path dir = userBaseDirectory("XDG_CACHE_HOME", ".cache");
    return dir;
}

std::filesystem::path EnsureUserCacheFile(const std::string &fileName) {
    const auto cacheDir = UserCacheDirectory();

    std::error_code ec;
    std::filesystem::create_directories(cacheDir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create user cache directory " + cacheDir.string() + ": " + ec.message());
    }

    return cacheDir / fileName;
}

} // namespace scout::data
