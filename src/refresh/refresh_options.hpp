#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "catalog/catalog_client.hpp"

namespace scout {

struct RefreshOptions {
    catalog::CatalogOptions catalog;
    std::chrono::seconds catalogTimeout{30};
    std::size_t catalogLimit = 500;
    std::chrono::seconds rateLimitCooldown{60};

    std::chrono::milliseconds probeTimeout{2000};
    std::size_t concurrencyLimit = 64;

    std::chrono::minutes cacheTtl{15};
    double readinessThreshold = 0.6;
    std::chrono::seconds cycleTimeout{30};
    std::size_t fallbackLimit = 50;

    // Empty selects servers.db under the user cache directory.
    std::string cachePath;
    std::chrono::minutes pruneInterval{30};
    std::chrono::hours staleAge{2};
    std::chrono::hours purgeAge{24};

    // Reads every value from ConfigStore, keeping the defaults above for missing keys.
    static RefreshOptions FromConfig();

    bool validate(std::string *error = nullptr) const;
};

} // namespace scout
