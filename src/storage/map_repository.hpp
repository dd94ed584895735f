#pragma once

#include "storage/database.hpp"
#include "core/map.hpp"
#include "core/result.hpp"
#include "core/search.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mindsync::storage {

/**
 * MapSyncState - The persisted sync bookkeeping of one map, without its
 * node payload.
 */
struct MapSyncState {
    std::string map_id;
    std::string vault_id;
    Timestamp local_modified_at;
    Timestamp last_synced_at;
    std::string remote_revision;
    SyncStatus status{SyncStatus::Pending};
    std::optional<std::string> sync_error;

    [[nodiscard]] bool is_dirty() const { return last_synced_at < local_modified_at; }
};

/**
 * MapRepository - Data access layer for maps, their nodes and edges.
 *
 * A map is always written whole: save() replaces every node and edge row.
 */
class MapRepository {
public:
    explicit MapRepository(Database& db) : db_(db) {}

    /**
     * Load a map with its nodes and edges. A stored tree that violates the
     * parent/edge invariants is reported as ErrorKind::Corruption.
     */
    [[nodiscard]] Result<std::optional<Map>, Error> get(const std::string& map_id);

    [[nodiscard]] Result<std::vector<MapSummary>, Error> list_by_vault(const std::string& vault_id);

    [[nodiscard]] Result<std::optional<MapSyncState>, Error> sync_state(const std::string& map_id);
    [[nodiscard]] Result<std::vector<MapSyncState>, Error> sync_states(const std::string& vault_id);

    [[nodiscard]] Result<void, Error> save(const Map& map, SyncStatus status);
    [[nodiscard]] Result<void, Error> remove(const std::string& map_id);

    [[nodiscard]] Result<void, Error> set_synced(
        const std::string& map_id,
        Timestamp last_synced_at,
        const std::string& remote_revision,
        SyncStatus status);

    [[nodiscard]] Result<void, Error> set_status(
        const std::string& map_id,
        SyncStatus status,
        const std::optional<std::string>& error);

    /**
     * Ids of maps with unsynchronized changes and no queued operation.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> dirty_without_operation();

    /**
     * Delete the vault's maps that have nothing left to push.
     * Returns the number of maps removed.
     */
    [[nodiscard]] Result<int, Error> remove_clean_by_vault(const std::string& vault_id);

    [[nodiscard]] Result<void, Error> remove_by_vault(const std::string& vault_id);

    /**
     * Case-insensitive match on map titles, node titles and node content.
     */
    [[nodiscard]] Result<std::vector<SearchResult>, Error> search(
        const std::string& vault_id,
        const std::string& query);

private:
    Database& db_;

    [[nodiscard]] MapSyncState row_to_state(Statement& stmt);
    [[nodiscard]] Result<std::vector<Node>, Error> load_nodes(const std::string& map_id);
    [[nodiscard]] Result<std::vector<Edge>, Error> load_edges(const std::string& map_id);
    [[nodiscard]] Result<void, Error> run(Statement& stmt);
};

} // namespace mindsync::storage
