#include <catch2/catch_test_macros.hpp>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include "cli/format.hpp"

using namespace mindsync;

namespace {

Map garden() {
    auto map = create_map("m1", "v1", "Garden", Timestamp(100));
    map.nodes.push_back(create_node("n-root", "Plot"));
    map.nodes.push_back(create_node("n-tools", "Tools", "n-root", 1));
    map.nodes.push_back(create_node("n-beds", "Beds", "n-root", 0));
    map.nodes.back().content = "north side\nsouth side";
    map.edges.push_back(Edge{.id = "e1", .source = "n-beds", .target = "n-root",
                             .kind = EdgeKind::Hierarchy, .label = {}});
    map.edges.push_back(Edge{.id = "e2", .source = "n-tools", .target = "n-beds",
                             .kind = EdgeKind::Reference, .label = "for"});
    return map;
}

} // namespace

TEST_CASE("CLI: map renders as an indented tree", "[cli]") {
    const auto output = cli::format_map(garden());
    const auto expected = QStringLiteral(
        "Garden\n"
        "  - Plot\n"
        "    - Beds\n"
        "      north side\n"
        "      south side\n"
        "    - Tools\n"
        "  ~ Tools -> Beds [for]\n");
    REQUIRE(output == expected);
}

TEST_CASE("CLI: ids are appended on request", "[cli]") {
    const auto output = cli::format_map(garden(), cli::FormatOptions{.includeIds = true});
    REQUIRE(output.startsWith(QStringLiteral("Garden (m1)\n")));
    REQUIRE(output.contains(QStringLiteral("- Tools (n-tools)")));
}

TEST_CASE("CLI: map JSON is the wire form", "[cli][json]") {
    const auto output = cli::format_map(garden(), cli::FormatOptions{.json = true});
    const auto doc = QJsonDocument::fromJson(output.toUtf8());
    REQUIRE(doc.isObject());
    REQUIRE(doc.object().value(QStringLiteral("id")).toString() == QStringLiteral("m1"));
    REQUIRE(doc.object().value(QStringLiteral("nodes")).toArray().size() == 3);
}

TEST_CASE("CLI: map list marks unsynced maps", "[cli]") {
    std::vector<MapSummary> maps{
        MapSummary{.id = "a", .vault_id = "v1", .title = "Synced", .node_count = 2,
                   .local_modified_at = Timestamp(10), .last_synced_at = Timestamp(10),
                   .remote_revision = "g1"},
        MapSummary{.id = "b", .vault_id = "v1", .title = "Edited", .node_count = 0,
                   .local_modified_at = Timestamp(20), .last_synced_at = Timestamp(10),
                   .remote_revision = "g2"}
    };

    REQUIRE(cli::format_map_list(maps) == QStringLiteral("- Synced  2 nodes\n* Edited  0 nodes\n"));

    const auto doc = QJsonDocument::fromJson(cli::format_map_list(maps, {.json = true}).toUtf8());
    REQUIRE(doc.isArray());
    REQUIRE_FALSE(doc.array().at(0).toObject().value(QStringLiteral("unsynced")).toBool());
    REQUIRE(doc.array().at(1).toObject().value(QStringLiteral("unsynced")).toBool());
}

TEST_CASE("CLI: vault list shows cache state", "[cli]") {
    std::vector<Vault> vaults{
        Vault{.id = "v1", .name = "Home", .remote_location = {}, .last_opened = std::nullopt,
              .last_full_sync = Timestamp(5), .remote_timestamp = Timestamp(5), .map_count = 3},
        Vault{.id = "v2", .name = "Work", .remote_location = {}, .last_opened = std::nullopt,
              .last_full_sync = std::nullopt, .remote_timestamp = Timestamp{}, .map_count = 0}
    };

    REQUIRE(cli::format_vaults(vaults) == QStringLiteral("Home  3 maps\nWork  0 maps (not cached)\n"));
    REQUIRE(cli::format_vaults(vaults, {.includeIds = true}).startsWith(QStringLiteral("Home (v1)  3 maps\n")));

    const auto doc = QJsonDocument::fromJson(cli::format_vaults(vaults, {.json = true}).toUtf8());
    REQUIRE(doc.array().size() == 2);
    REQUIRE(doc.array().at(1).toObject().value(QStringLiteral("lastFullSync")).isNull());
}

TEST_CASE("CLI: search results and resolutions", "[cli]") {
    std::vector<SearchResult> results{
        SearchResult{.map_id = "m1", .map_title = "Garden", .node_id = std::nullopt,
                     .node_title = {}, .snippet = "Garden"},
        SearchResult{.map_id = "m1", .map_title = "Garden", .node_id = std::string("n-beds"),
                     .node_title = "Beds", .snippet = "north side"}
    };
    REQUIRE(cli::format_search_results(results) ==
            QStringLiteral("Garden: Garden\nGarden / Beds: north side\n"));

    std::vector<ResolutionEntry> entries{
        ResolutionEntry{.id = 1, .map_id = "m1", .vault_id = "v1", .winner = Winner::Remote,
                        .backup_ref = std::string("m1@0"), .resolved_at = Timestamp(0)}
    };
    REQUIRE(cli::format_resolutions(entries) ==
            QStringLiteral("1970-01-01T00:00:00.000Z remote won on m1, backup m1@0\n"));
}

TEST_CASE("CLI: empty lists print nothing", "[cli]") {
    REQUIRE(cli::format_vaults({}).isEmpty());
    REQUIRE(cli::format_map_list({}).isEmpty());
    REQUIRE(cli::format_search_results({}).isEmpty());
}
