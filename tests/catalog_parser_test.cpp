#include <catch2/catch.hpp>

#include "catalog/catalog_parser.hpp"

using scout::SourceKind;
using scout::catalog::CatalogPage;
using scout::catalog::ClassifySourceKind;
using scout::catalog::ExtractMapFromName;
using scout::catalog::ParseCatalogPage;

TEST_CASE("Catalog page entries decode into records", "[catalog][parser]") {
    const std::string body = R"({
        "data": [
            {"id": "1", "attributes": {
                "name": "DayZ US 1234 Livonia", "ip": "10.0.0.1", "port": 2402,
                "players": 80, "maxPlayers": 60, "country": "US", "private": false,
                "status": "online", "details": {"queryPort": 27016}}},
            {"id": "2", "attributes": {
                "name": "Modded Namalsk", "ip": "10.0.0.2",
                "players": 3, "maxPlayers": 40, "country": "DE",
                "details": {"modIds": ["1559212036", "1564026768"]}}},
            {"id": "3", "attributes": {"name": "No address", "players": 1}}
        ],
        "links": {"next": "https://catalog.test/servers?page[key]=abc"}
    })";

    CatalogPage page;
    std::string error;
    const auto fetchedAt = scout::time::FromUnixMillis(1000);
    REQUIRE(ParseCatalogPage(body, fetchedAt, page, &error));
    REQUIRE(page.records.size() == 2);

    const auto &first = page.records[0];
    CHECK(first.address.host == "10.0.0.1");
    CHECK(first.address.port == 2402);
    CHECK(first.queryPort == 27016);
    CHECK(first.playerCount == 60);
    CHECK(first.maxPlayers == 60);
    CHECK(first.map == "Livonia");
    CHECK_FALSE(first.modsPresent);
    CHECK(first.fetchedAt == fetchedAt);
    CHECK(first.lastSeenAt == fetchedAt);

    const auto &second = page.records[1];
    CHECK(second.address.port == 2302);
    CHECK(second.queryPort == 2303);
    CHECK(second.modsPresent);
    CHECK(second.sourceKind == SourceKind::Community);

    REQUIRE(page.nextUrl.has_value());
    CHECK(*page.nextUrl == "https://catalog.test/servers?page[key]=abc");
}

TEST_CASE("Out of range numbers fall back to defaults", "[catalog][parser]") {
    const std::string body = R"({
        "data": [
            {"id": "1", "attributes": {
                "name": "Huge numbers", "ip": "10.0.0.9", "port": 1e20,
                "players": 1e300, "maxPlayers": 5000000000, "country": "FI"}},
            {"id": "2", "attributes": {
                "name": "Negative huge", "ip": "10.0.0.10", "port": 2402,
                "players": -9000000000, "maxPlayers": 60.7, "country": "FI"}}
        ]
    })";

    CatalogPage page;
    std::string error;
    REQUIRE(ParseCatalogPage(body, scout::Timestamp{}, page, &error));
    REQUIRE(page.records.size() == 2);

    CHECK(page.records[0].address.port == 2302);
    CHECK(page.records[0].playerCount == 0);
    CHECK(page.records[0].maxPlayers == 0);

    CHECK(page.records[1].playerCount == 0);
    CHECK(page.records[1].maxPlayers == 60);
}

TEST_CASE("Undecodable catalog bodies are reported", "[catalog][parser]") {
    CatalogPage page;
    std::string error;
    CHECK_FALSE(ParseCatalogPage("<html>busy</html>", scout::Timestamp{}, page, &error));
    CHECK_FALSE(error.empty());

    CHECK_FALSE(ParseCatalogPage(R"({"errors": []})", scout::Timestamp{}, page, &error));
}

TEST_CASE("Map names are guessed from server names", "[catalog][parser]") {
    CHECK(ExtractMapFromName("[EU] Cherno PvP") == "Chernarus");
    CHECK(ExtractMapFromName("DeerIsle hardcore") == "Deer Isle");
    CHECK(ExtractMapFromName("swans island survival") == "Swans Island");
    CHECK(ExtractMapFromName("Vanilla server") == "Unknown");
}

TEST_CASE("Source kind classification", "[catalog][parser]") {
    CHECK(ClassifySourceKind("DayZ DE 0451 (public)", false, false) == SourceKind::Official);
    CHECK(ClassifySourceKind("DayZ US 1234", true, false) == SourceKind::Private);
    CHECK(ClassifySourceKind("Whitelist only DayZ", false, false) == SourceKind::Private);
    CHECK(ClassifySourceKind("DayZ DE 0451", false, true) == SourceKind::Community);
    CHECK(ClassifySourceKind("[EU] DayZ DE x10 loot", false, false) == SourceKind::Community);
    CHECK(ClassifySourceKind("Some server", false, false) == SourceKind::Community);
}
