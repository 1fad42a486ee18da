#include "refresh/refresh_options.hpp"

#include "common/config_helpers.hpp"
#include "common/config_store.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace {

std::size_t readCount(const char *path, std::size_t defaultValue) {
    const int value = scout::config::ReadIntConfig({path}, static_cast<int>(defaultValue));
    if (value <= 0) {
        spdlog::warn("Config '{}' must be positive; using {}", path, defaultValue);
        return defaultValue;
    }
    return static_cast<std::size_t>(value);
}

template <typename Duration>
Duration readDuration(const char *path, Duration defaultValue) {
    const int value = scout::config::ReadIntConfig({path}, static_cast<int>(defaultValue.count()));
    if (value <= 0) {
        spdlog::warn("Config '{}' must be positive; using {}", path, defaultValue.count());
        return defaultValue;
    }
    return Duration(value);
}

} // namespace

namespace scout {

RefreshOptions RefreshOptions::FromConfig() {
    RefreshOptions options;
    if (!config::ConfigStore::Initialized()) {
        spdlog::debug("RefreshOptions: ConfigStore not initialized; using built-in defaults");
        return options;
    }

    options.catalog.baseUrl = config::ReadStringConfig("catalog.BaseUrl", options.catalog.baseUrl);
    options.catalog.game = config::ReadStringConfig("catalog.Game", options.catalog.game);
    options.catalog.pageSize = static_cast<int>(
        readCount("catalog.PageSize", static_cast<std::size_t>(options.catalog.pageSize)));
    options.catalog.maxAttempts = static_cast<int>(
        readCount("catalog.MaxAttempts", static_cast<std::size_t>(options.catalog.maxAttempts)));
    options.catalog.backoff = readDuration("catalog.BackoffMs", options.catalog.backoff);
    options.catalogTimeout = readDuration("catalog.TimeoutSeconds", options.catalogTimeout);
    options.catalogLimit = readCount("catalog.Limit", options.catalogLimit);
    options.rateLimitCooldown = readDuration("catalog.RateLimitCooldownSeconds", options.rateLimitCooldown);

    options.probeTimeout = readDuration("probe.TimeoutMs", options.probeTimeout);
    options.concurrencyLimit = readCount("probe.ConcurrencyLimit", options.concurrencyLimit);

    options.cacheTtl = readDuration("refresh.CacheTtlMinutes", options.cacheTtl);
    options.readinessThreshold = config::ReadDoubleConfig({"refresh.ReadinessThreshold"}, options.readinessThreshold);
    options.cycleTimeout = readDuration("refresh.CycleTimeoutSeconds", options.cycleTimeout);
    options.fallbackLimit = readCount("refresh.FallbackLimit", options.fallbackLimit);

    options.cachePath = config::ReadStringConfig("cache.Path", options.cachePath);
    options.pruneInterval = readDuration("cache.PruneIntervalMinutes", options.pruneInterval);
    options.staleAge = readDuration("cache.StaleHours", options.staleAge);
    options.purgeAge = readDuration("cache.PurgeHours", options.purgeAge);

    return options;
}

bool RefreshOptions::validate(std::string *error) const {
    auto fail = [error](const char *message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    if (catalog.baseUrl.empty()) {
        return fail("catalog base URL is empty");
    }
    if (concurrencyLimit == 0) {
        return fail("probe concurrency limit must be at least 1");
    }
    if (readinessThreshold <= 0.0 || readinessThreshold > 1.0) {
        return fail("readiness threshold must be in (0, 1]");
    }
    if (probeTimeout.count() <= 0 || cycleTimeout.count() <= 0) {
        return fail("timeouts must be positive");
    }
    if (purgeAge < staleAge) {
        return fail("purge age must not be shorter than the stale age");
    }
    return true;
}

} // namespace scout
