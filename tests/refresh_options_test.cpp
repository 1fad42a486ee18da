#include <catch2/catch.hpp>

#include "common/config_store.hpp"
#include "refresh/refresh_options.hpp"

using scout::RefreshOptions;
using scout::config::ConfigStore;

TEST_CASE("Options come from the merged config layers", "[config]") {
    auto defaults = scout::json::Parse(R"({
        "catalog": {"BaseUrl": "https://catalog.example", "Limit": 200, "PageSize": 50,
                    "RateLimitCooldownSeconds": 90},
        "probe": {"TimeoutMs": 1500, "ConcurrencyLimit": 32},
        "refresh": {"CacheTtlMinutes": 10, "ReadinessThreshold": 0.6, "CycleTimeoutSeconds": 20},
        "cache": {"StaleHours": 3, "PurgeHours": 48}
    })");
    auto user = scout::json::Parse(R"({"probe": {"ConcurrencyLimit": 8}, "cache": {"Path": "/tmp/scout.db"}})");
    ConfigStore::InitializeFromValues(std::move(defaults), std::move(user));

    const RefreshOptions options = RefreshOptions::FromConfig();
    CHECK(options.catalog.baseUrl == "https://catalog.example");
    CHECK(options.catalog.pageSize == 50);
    CHECK(options.catalogLimit == 200);
    CHECK(options.rateLimitCooldown == std::chrono::seconds(90));
    CHECK(options.probeTimeout == std::chrono::milliseconds(1500));
    CHECK(options.concurrencyLimit == 8);
    CHECK(options.cacheTtl == std::chrono::minutes(10));
    CHECK(options.readinessThreshold == Approx(0.6));
    CHECK(options.cycleTimeout == std::chrono::seconds(20));
    CHECK(options.cachePath == "/tmp/scout.db");
    CHECK(options.staleAge == std::chrono::hours(3));
    CHECK(options.purgeAge == std::chrono::hours(48));
    CHECK(options.fallbackLimit == 50);
    CHECK(options.validate());
}

TEST_CASE("Non-positive config values keep the defaults", "[config]") {
    ConfigStore::InitializeFromValues(
        scout::json::Parse(R"({"probe": {"ConcurrencyLimit": 0, "TimeoutMs": "abc"}})"),
        scout::json::Object());

    const RefreshOptions options = RefreshOptions::FromConfig();
    CHECK(options.concurrencyLimit == 64);
    CHECK(options.probeTimeout == std::chrono::milliseconds(2000));
}

TEST_CASE("Config numbers outside the integer range keep the defaults", "[config]") {
    ConfigStore::InitializeFromValues(
        scout::json::Parse(R"({"probe": {"ConcurrencyLimit": 1e300, "TimeoutMs": 9000000000},
                              "catalog": {"Limit": -1e12, "PageSize": 40.9}})"),
        scout::json::Object());

    const RefreshOptions options = RefreshOptions::FromConfig();
    CHECK(options.concurrencyLimit == 64);
    CHECK(options.probeTimeout == std::chrono::milliseconds(2000));
    CHECK(options.catalogLimit == RefreshOptions{}.catalogLimit);
    CHECK(options.catalog.pageSize == 40);
}

TEST_CASE("Inconsistent options fail validation", "[config]") {
    RefreshOptions options;
    std::string error;

    SECTION("threshold out of range") {
        options.readinessThreshold = 1.5;
        CHECK_FALSE(options.validate(&error));
        CHECK(error.find("threshold") != std::string::npos);
    }
    SECTION("purge before prune") {
        options.purgeAge = std::chrono::hours(1);
        CHECK_FALSE(options.validate(&error));
    }
    SECTION("no concurrency") {
        options.concurrencyLimit = 0;
        CHECK_FALSE(options.validate(&error));
    }
}
