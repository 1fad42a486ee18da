#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "browser/server_record.hpp"
#include "common/clock.hpp"

namespace scout::catalog {

struct CatalogPage {
    std::vector<ServerRecord> records;
    std::optional<std::string> nextUrl;
};

// Decodes one JSON:API page of the catalog. Entries without an ip are skipped.
bool ParseCatalogPage(std::string_view body, Timestamp fetchedAt, CatalogPage &out, std::string *error);

// Title-cased map name guessed from the server name, or "Unknown".
std::string ExtractMapFromName(std::string_view serverName);

SourceKind ClassifySourceKind(std::string_view serverName, bool privateFlag, bool modsPresent);

} // namespace scout::catalog
