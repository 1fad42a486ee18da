#include "common/config_store.hpp"

#include "common/data_path_resolver.hpp"

#include <mutex>

namespace {

// Defaults with the user layer merged over them. Replaced wholesale on initialize.
struct ConfigStoreState {
    std::mutex mutex;
    bool initialized = false;
    scout::json::Value merged = scout::json::Object();
};

ConfigStoreState g_state;

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t position = 0;
    while (position <= path.size()) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string_view::npos);
        std::string segment(path.substr(position, lastSegment ? std::string_view::npos : dot - position));
        if (segment.empty()) {
            return {};
        }
        segments.push_back(std::move(segment));
        if (lastSegment) {
            break;
        }
        position = dot + 1;
    }
    return segments;
}

const scout::json::Value *resolvePath(const scout::json::Value &root, std::string_view path) {
    if (path.empty()) {
        return &root;
    }

    const auto segments = splitPath(path);
    if (segments.empty()) {
        return nullptr;
    }

    const scout::json::Value *current = &root;
    for (const auto &segment : segments) {
        if (!current->is_object()) {
            return nullptr;
        }
        const auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

void mergeJsonObjects(scout::json::Value &destination, const scout::json::Value &source) {
    if (!destination.is_object() || !source.is_object()) {
        destination = source;
        return;
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto &key = it.key();
        const auto &value = it.value();
        if (value.is_object() && destination.contains(key) && destination[key].is_object()) {
            mergeJsonObjects(destination[key], value);
        } else {
            destination[key] = value;
        }
    }
}

scout::json::Value loadLayers(const std::vector<scout::config::ConfigFileSpec> &specs) {
    scout::json::Value merged = scout::json::Object();
    for (const auto &spec : specs) {
        std::filesystem::path path = spec.path;
        if (spec.resolveRelativeToDataRoot && path.is_relative()) {
            path = scout::data::Resolve(path);
        }
        const std::string label = spec.label.empty() ? path.string() : spec.label;
        spdlog::trace("config_store: loading config file '{}' (label: {})", path.string(), label);
        auto jsonOpt = scout::data::LoadJsonFile(path, label, spec.missingLevel);
        if (!jsonOpt) {
            if (spec.required) {
                spdlog::error("config_store: Required config missing: {}", path.string());
            }
            continue;
        }
        if (!jsonOpt->is_object()) {
            spdlog::warn("config_store: Config {} is not a JSON object, skipping", path.string());
            continue;
        }
        mergeJsonObjects(merged, *jsonOpt);
    }
    return merged;
}

} // namespace

namespace scout::config {

void ConfigStore::Initialize(const std::vector<ConfigFileSpec> &defaultSpecs,
                             const std::filesystem::path &userConfigPath) {
    scout::json::Value defaults = loadLayers(defaultSpecs);

    std::filesystem::path resolvedUserPath = userConfigPath;
    if (resolvedUserPath.empty()) {
        try {
            resolvedUserPath = scout::data::UserConfigDirectory() / "config.json";
        } catch (const std::exception &ex) {
            spdlog::warn("config_store: {}", ex.what());
        }
    }

    scout::json::Value userJson = scout::json::Object();
    if (!resolvedUserPath.empty()) {
        spdlog::trace("config_store: loading user config '{}'", resolvedUserPath.string());
        if (auto userOpt = scout::data::LoadJsonFile(resolvedUserPath, "user config", spdlog::level::debug)) {
            if (userOpt->is_object()) {
                userJson = std::move(*userOpt);
            } else {
                spdlog::warn("config_store: User config {} is not a JSON object", resolvedUserPath.string());
            }
        }
    }

    InitializeFromValues(std::move(defaults), std::move(userJson));
}

void ConfigStore::InitializeFromValues(scout::json::Value defaults, scout::json::Value user) {
    scout::json::Value merged = defaults.is_object() ? std::move(defaults) : scout::json::Object();
    if (user.is_object()) {
        mergeJsonObjects(merged, user);
    }

    std::lock_guard<std::mutex> lock(g_state.mutex);
    g_state.merged = std::move(merged);
    g_state.initialized = true;
}

bool ConfigStore::Initialized() {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    return g_state.initialized;
}

const scout::json::Value *ConfigStore::Get(std::string_view path) {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    if (!g_state.initialized) {
        return nullptr;
    }
    spdlog::trace("config_store: request for key '{}'", path);
    return resolvePath(g_state.merged, path);
}

} // namespace scout::config
