#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "browser/errors.hpp"
#include "browser/filter_criteria.hpp"
#include "browser/server_record.hpp"
#include "catalog/http_transport.hpp"
#include "common/clock.hpp"

namespace scout::catalog {

struct CatalogOptions {
    std::string baseUrl = "https://api.battlemetrics.com";
    std::string game = "dayz";
    int pageSize = 100;
    int maxAttempts = 3;
    std::chrono::milliseconds backoff{500};
};

struct CatalogResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::Network;
    std::string message;
    // Cooldown requested by the remote alongside a rate-limit response.
    std::optional<std::chrono::seconds> retryAfter;
    std::vector<ServerRecord> records;
};

class CatalogSource {
public:
    virtual ~CatalogSource() = default;
    virtual CatalogResult fetchCatalog(const FilterCriteria &criteria, std::size_t limit) = 0;
};

class CatalogClient final : public CatalogSource {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    CatalogClient(CatalogOptions options, HttpTransport &transport, const Clock &clock, Sleeper sleeper = {});

    // Returns records in remote order, paging until limit is reached or the
    // remote runs out. Never touches the cache.
    CatalogResult fetchCatalog(const FilterCriteria &criteria, std::size_t limit) override;

    std::string buildFirstPageUrl(const FilterCriteria &criteria, std::size_t pageSize) const;

private:
    struct PageOutcome {
        bool ok = false;
        ErrorKind kind = ErrorKind::Network;
        std::string message;
        std::optional<std::chrono::seconds> retryAfter;
        std::string body;
    };

    PageOutcome getWithRetry(const std::string &url);

    CatalogOptions options;
    HttpTransport &transport;
    const Clock &clock;
    Sleeper sleeper;
};

} // namespace scout::catalog
