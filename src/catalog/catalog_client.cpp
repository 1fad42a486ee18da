#include "catalog/catalog_client.hpp"

#include "catalog/catalog_parser.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <thread>
#include <unordered_set>
#include <utility>

namespace {

constexpr std::size_t kMaxPageSize = 100;

std::string percentEncode(const std::string &value) {
    static const char *hex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char ch : value) {
        const bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == ',';
        if (unreserved) {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[ch >> 4]);
            encoded.push_back(hex[ch & 0x0F]);
        }
    }
    return encoded;
}

std::string wireKey(const std::string &key) {
    if (key == "search") {
        return key;
    }
    // "countries[]" nests as "filter[countries][]".
    const auto bracket = key.find('[');
    if (bracket != std::string::npos) {
        return "filter[" + key.substr(0, bracket) + "]" + key.substr(bracket);
    }
    return "filter[" + key + "]";
}

std::string trimTrailingSlashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool isRetryableStatus(long status) {
    return status >= 500 && status < 600;
}

} // namespace

namespace scout::catalog {

CatalogClient::CatalogClient(CatalogOptions options, HttpTransport &transport, const Clock &clock, Sleeper sleeper)
    : options(std::move(options)),
      transport(transport),
      clock(clock),
      sleeper(std::move(sleeper)) {
    if (!this->sleeper) {
        this->sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    this->options.maxAttempts = std::max(1, this->options.maxAttempts);
    this->options.pageSize = std::clamp(this->options.pageSize, 1, static_cast<int>(kMaxPageSize));
}

std::string CatalogClient::buildFirstPageUrl(const FilterCriteria &criteria, std::size_t pageSize) const {
    std::string url = trimTrailingSlashes(options.baseUrl) + "/servers";
    url += "?filter[game]=" + percentEncode(options.game);
    url += "&filter[status]=online";
    url += "&page[size]=" + std::to_string(pageSize);
    url += "&sort=-players";

    for (const auto &[key, value] : criteria.toQueryParameters()) {
        url += "&" + wireKey(key) + "=" + percentEncode(value);
    }
    return url;
}

CatalogResult CatalogClient::fetchCatalog(const FilterCriteria &criteria, std::size_t limit) {
    CatalogResult result;
    if (limit == 0) {
        result.ok = true;
        return result;
    }

    std::unordered_set<std::string> seenKeys;
    std::optional<std::string> nextUrl;
    std::size_t pageIndex = 0;

    while (result.records.size() < limit) {
        const std::size_t remaining = limit - result.records.size();
        const std::size_t pageSize = std::min<std::size_t>(static_cast<std::size_t>(options.pageSize), remaining);
        const std::string url = nextUrl ? *nextUrl : buildFirstPageUrl(criteria, pageSize);

        spdlog::debug("CatalogClient: Requesting page {} ({} record(s) wanted)", pageIndex + 1, pageSize);
        PageOutcome outcome = getWithRetry(url);
        if (!outcome.ok) {
            result.ok = false;
            result.kind = outcome.kind;
            result.message = std::move(outcome.message);
            result.retryAfter = outcome.retryAfter;
            result.records.clear();
            return result;
        }

        CatalogPage page;
        std::string parseError;
        if (!ParseCatalogPage(outcome.body, clock.now(), page, &parseError)) {
            spdlog::warn("CatalogClient: Failed to decode page {}: {}", pageIndex + 1, parseError);
            result.ok = false;
            result.kind = ErrorKind::Network;
            result.message = std::move(parseError);
            result.records.clear();
            return result;
        }

        const bool emptyPage = page.records.empty();
        for (auto &record : page.records) {
            if (result.records.size() >= limit) {
                break;
            }
            if (!seenKeys.insert(record.address.key()).second) {
                continue;
            }
            result.records.push_back(std::move(record));
        }

        ++pageIndex;
        if (emptyPage || !page.nextUrl) {
            break;
        }
        nextUrl = std::move(page.nextUrl);
    }

    spdlog::info("CatalogClient: Fetched {} record(s) across {} page(s)", result.records.size(), pageIndex);
    result.ok = true;
    return result;
}

CatalogClient::PageOutcome CatalogClient::getWithRetry(const std::string &url) {
    PageOutcome outcome;
    std::chrono::milliseconds delay = options.backoff;

    for (int attempt = 1; attempt <= options.maxAttempts; ++attempt) {
        HttpResponse response = transport.get(url);

        if (response.transportOk && response.status >= 200 && response.status < 300) {
            outcome.ok = true;
            outcome.body = std::move(response.body);
            return outcome;
        }

        if (response.transportOk && response.status == 429) {
            spdlog::warn("CatalogClient: Rate limited by catalog (retry after {}s)",
                         response.retryAfter ? response.retryAfter->count() : 0);
            outcome.kind = ErrorKind::RateLimit;
            outcome.message = "catalog returned HTTP 429";
            outcome.retryAfter = response.retryAfter;
            return outcome;
        }

        outcome.kind = ErrorKind::Network;
        if (!response.transportOk) {
            outcome.message = response.error.empty() ? std::string("request failed") : response.error;
        } else {
            outcome.message = "catalog returned HTTP " + std::to_string(response.status);
            if (!isRetryableStatus(response.status)) {
                spdlog::warn("CatalogClient: {} returned HTTP status {}", url, response.status);
                return outcome;
            }
        }

        if (attempt < options.maxAttempts) {
            spdlog::warn("CatalogClient: Attempt {}/{} failed ({}); retrying in {} ms",
                         attempt, options.maxAttempts, outcome.message, delay.count());
            sleeper(delay);
            delay *= 2;
        }
    }

    spdlog::warn("CatalogClient: Giving up after {} attempt(s): {}", options.maxAttempts, outcome.message);
    return outcome;
}

} // namespace scout::catalog
