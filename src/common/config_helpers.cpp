#include "common/config_helpers.hpp"

#include "common/config_store.hpp"
#include "common/json.hpp"
#include "spdlog/spdlog.h"

#include <stdexcept>

namespace scout::config {

int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue) {
    for (const char* path : paths) {
        const auto* value = ConfigStore::Get(path);
        if (!value) {
            continue;
        }
        if (value->is_number()) {
            if (const auto converted = json::ToInt(*value)) {
                return *converted;
            }
            spdlog::warn("Config '{}' is outside the integer range", path);
            return defaultValue;
        }
        if (value->is_string()) {
            try {
                return std::stoi(value->get<std::string>());
            } catch (const std::exception &) {
                spdlog::warn("Config '{}' string value is not a valid integer", path);
            }
            return defaultValue;
        }
        spdlog::warn("Config '{}' cannot be interpreted as integer", path);
    }
    return defaultValue;
}

double ReadDoubleConfig(std::initializer_list<const char*> paths, double defaultValue) {
    for (const char* path : paths) {
        if (const auto* value = ConfigStore::Get(path)) {
            if (value->is_number()) {
                return value->get<double>();
            }
            if (value->is_string()) {
                try {
                    return std::stod(value->get<std::string>());
                } catch (const std::exception &) {
                    spdlog::warn("Config '{}' string value is not a valid number", path);
                }
            } else {
                spdlog::warn("Config '{}' cannot be interpreted as a number", path);
            }
        }
    }
    return defaultValue;
}

std::string ReadStringConfig(const char *path, const std::string &defaultValue) {
    if (const auto* value = ConfigStore::Get(path)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
        spdlog::warn("Config '{}' is not a string", path);
    }
    return defaultValue;
}

} // namespace scout::config
