#include "browser/filter_criteria.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace {

constexpr std::size_t kMaxSearchLength = 128;

std::string trimCopy(const std::string &value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    }).base();

    if (begin >= end) {
        return {};
    }

    return std::string(begin, end);
}

std::string upperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool isCountryCode(const std::string &code) {
    return code.size() == 2 &&
        std::isalpha(static_cast<unsigned char>(code[0])) != 0 &&
        std::isalpha(static_cast<unsigned char>(code[1])) != 0;
}

std::string joinCodes(const std::vector<std::string> &codes) {
    std::string joined;
    for (const auto &code : codes) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += code;
    }
    return joined;
}

std::optional<std::string> normalizedSearch(const std::optional<std::string> &search) {
    if (!search) {
        return std::nullopt;
    }
    std::string trimmed = trimCopy(*search);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

} // namespace

namespace scout {

const char *RegionName(Region region) {
    switch (region) {
        case Region::Europe:
            return "europe";
        case Region::NorthAmerica:
            return "north_america";
        case Region::Oceania:
            return "oceania";
    }
    return "europe";
}

std::optional<Region> ParseRegion(std::string_view text) {
    const std::string lowered = lowerCopy(std::string(text));
    if (lowered == "europe") {
        return Region::Europe;
    }
    if (lowered == "north_america") {
        return Region::NorthAmerica;
    }
    if (lowered == "oceania") {
        return Region::Oceania;
    }
    return std::nullopt;
}

const std::vector<std::string> &ExpandRegion(Region region) {
    static const std::vector<std::string> europe = {"DE", "FR", "UK", "NL", "SE", "NO", "PL", "IT", "ES"};
    static const std::vector<std::string> northAmerica = {"US", "CA"};
    static const std::vector<std::string> oceania = {"AU", "NZ"};
    switch (region) {
        case Region::Europe:
            return europe;
        case Region::NorthAmerica:
            return northAmerica;
        case Region::Oceania:
            return oceania;
    }
    return europe;
}

bool FilterCriteria::validate(std::string *error) const {
    auto fail = [error](std::string message) {
        if (error) {
            *error = std::move(message);
        }
        return false;
    };

    if (countries) {
        if (countries->empty()) {
            return fail("explicit country set is empty");
        }
        for (const auto &code : *countries) {
            if (!isCountryCode(code)) {
                return fail("invalid country code '" + code + "'");
            }
        }
        if (region) {
            const auto &expansion = ExpandRegion(*region);
            for (const auto &code : *countries) {
                if (std::find(expansion.begin(), expansion.end(), upperCopy(code)) == expansion.end()) {
                    return fail("country '" + upperCopy(code) + "' conflicts with region '" +
                                RegionName(*region) + "'");
                }
            }
        }
    }

    if (search && search->size() > kMaxSearchLength) {
        return fail("search term exceeds " + std::to_string(kMaxSearchLength) + " characters");
    }

    return true;
}

std::vector<std::string> FilterCriteria::effectiveCountries() const {
    if (countries) {
        std::vector<std::string> codes;
        codes.reserve(countries->size());
        for (const auto &code : *countries) {
            std::string normalized = upperCopy(code);
            if (std::find(codes.begin(), codes.end(), normalized) == codes.end()) {
                codes.push_back(std::move(normalized));
            }
        }
        return codes;
    }
    if (region) {
        return ExpandRegion(*region);
    }
    return {};
}

QueryParameters FilterCriteria::toQueryParameters() const {
    QueryParameters params;

    const auto codes = effectiveCountries();
    if (!codes.empty()) {
        params.emplace_back("countries[]", joinCodes(codes));
    }

    bool modFree = mods.has_value() && !*mods;
    if (serverType) {
        switch (*serverType) {
            case SourceKind::Private:
                params.emplace_back("private", "true");
                break;
            case SourceKind::Community:
                params.emplace_back("private", "false");
                break;
            case SourceKind::Official:
                modFree = true;
                break;
        }
    }
    if (modFree) {
        params.emplace_back("mods", "");
    }

    if (const auto term = normalizedSearch(search)) {
        params.emplace_back("search", *term);
    }

    return params;
}

std::string FilterCriteria::cacheKey() const {
    auto codes = effectiveCountries();
    std::sort(codes.begin(), codes.end());

    std::string key = "countries=" + joinCodes(codes);
    key += "|type=";
    key += serverType ? SourceKindName(*serverType) : "*";
    key += "|mods=";
    key += mods ? (*mods ? "1" : "0") : "*";
    key += "|search=";
    if (const auto term = normalizedSearch(search)) {
        key += lowerCopy(*term);
    }
    return key;
}

bool FilterCriteria::matches(const ServerRecord &record) const {
    const auto codes = effectiveCountries();
    if (!codes.empty()) {
        const std::string country = upperCopy(record.country);
        if (std::find(codes.begin(), codes.end(), country) == codes.end()) {
            return false;
        }
    }
    if (serverType && record.sourceKind != *serverType) {
        return false;
    }
    if (mods && record.modsPresent != *mods) {
        return false;
    }
    if (const auto term = normalizedSearch(search)) {
        if (lowerCopy(record.name).find(lowerCopy(*term)) == std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace scout
