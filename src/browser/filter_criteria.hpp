#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "browser/server_record.hpp"

namespace scout {

enum class Region {
    Europe,
    NorthAmerica,
    Oceania
};

const char *RegionName(Region region);
std::optional<Region> ParseRegion(std::string_view text);

// Fixed country-code expansion used for catalog queries, in wire order.
const std::vector<std::string> &ExpandRegion(Region region);

using QueryParameters = std::vector<std::pair<std::string, std::string>>;

struct FilterCriteria {
    std::optional<Region> region;
    std::optional<std::vector<std::string>> countries;
    std::optional<SourceKind> serverType;
    std::optional<std::string> search;
    std::optional<bool> mods;

    // Rejects malformed country codes, an explicit set outside the selected region,
    // and oversized search terms.
    bool validate(std::string *error = nullptr) const;

    // The explicit country set when present, else the region expansion, else empty.
    std::vector<std::string> effectiveCountries() const;

    // Catalog parameters keyed exactly as the remote service names them
    // (countries[], private, mods, search).
    QueryParameters toQueryParameters() const;

    // Canonical text used to decide whether two requests are equivalent.
    std::string cacheKey() const;

    bool matches(const ServerRecord &record) const;
};

} // namespace scout
