#pragma once

#include "storage/backup_repository.hpp"
#include "storage/database.hpp"
#include "storage/lock_repository.hpp"
#include "storage/map_repository.hpp"
#include "storage/queue_repository.hpp"
#include "storage/vault_repository.hpp"
#include "core/map.hpp"
#include "core/result.hpp"
#include "core/search.hpp"
#include "core/sync_types.hpp"
#include "core/types.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mindsync::storage {

/**
 * LocalStore - The device's authoritative copy of every cached vault.
 *
 * Every caller-facing mutation writes the map rows, bumps
 * local_modified_at and enqueues a coalesced SyncOperation in a single
 * transaction, so the queue can never disagree with the maps table.
 *
 * Thread-safe: each public call holds the store mutex for the duration of
 * its SQLite work and nothing else. No call performs network I/O.
 */
class LocalStore {
public:
    LocalStore(Database db, const Clock& clock);

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * Open (or create) the database at `path` and run migrations.
     */
    [[nodiscard]] static Result<std::unique_ptr<LocalStore>, Error> open(
        const std::string& path, const Clock& clock);

    [[nodiscard]] static Result<std::unique_ptr<LocalStore>, Error> open_memory(const Clock& clock);

    [[nodiscard]] const Clock& clock() const { return clock_; }

    // ------------------------------------------------------------------
    // Vaults
    // ------------------------------------------------------------------

    [[nodiscard]] Result<Vault, Error> create_vault(const std::string& name,
                                                    const std::string& remote_location);

    /**
     * Return the vault, creating an uncached record named after its id if
     * this device has never seen it.
     */
    [[nodiscard]] Result<Vault, Error> ensure_vault(const std::string& vault_id);

    [[nodiscard]] Result<std::optional<Vault>, Error> get_vault(const std::string& vault_id);
    [[nodiscard]] Result<std::vector<Vault>, Error> list_vaults();

    /**
     * Remove the vault and its maps locally and queue a remote delete for
     * every map it held.
     */
    [[nodiscard]] Result<void, Error> delete_vault(const std::string& vault_id);

    [[nodiscard]] Result<void, Error> mark_vault_opened(const std::string& vault_id);

    /**
     * Record a completed pull or merge pass against the backend timestamp.
     */
    [[nodiscard]] Result<void, Error> record_vault_reconciled(const std::string& vault_id,
                                                              Timestamp remote_timestamp);

    /**
     * Move the backend timestamp forward after pushes that left the local
     * copy matching the backend. Does not mark the vault as cached.
     */
    [[nodiscard]] Result<void, Error> record_remote_timestamp(const std::string& vault_id,
                                                              Timestamp remote_timestamp);

    // ------------------------------------------------------------------
    // Maps
    // ------------------------------------------------------------------

    [[nodiscard]] Result<Map, Error> create_map(const std::string& vault_id, const std::string& title);
    [[nodiscard]] Result<Map, Error> rename_map(const std::string& map_id, const std::string& title);

    /**
     * Insert or replace a node by id. The parent must exist in the same
     * map and must not be the node itself or one of its descendants.
     */
    [[nodiscard]] Result<Map, Error> update_node(const std::string& map_id, Node node);

    [[nodiscard]] Result<Node, Error> add_node(
        const std::string& map_id,
        const std::optional<std::string>& parent_id,
        const std::string& title,
        const std::string& content = {});

    /**
     * Remove a node with its whole subtree and every edge touching it.
     */
    [[nodiscard]] Result<Map, Error> remove_node(const std::string& map_id, const std::string& node_id);

    [[nodiscard]] Result<Edge, Error> add_edge(
        const std::string& map_id,
        const std::string& source,
        const std::string& target,
        EdgeKind kind,
        const std::string& label = {});

    [[nodiscard]] Result<Map, Error> remove_edge(const std::string& map_id, const std::string& edge_id);

    [[nodiscard]] Result<void, Error> delete_map(const std::string& map_id);

    [[nodiscard]] Result<std::vector<MapSummary>, Error> list_maps(const std::string& vault_id);
    [[nodiscard]] Result<std::optional<Map>, Error> get_map(const std::string& map_id);
    [[nodiscard]] Result<std::vector<SearchResult>, Error> search(const std::string& vault_id,
                                                                  const std::string& query);

    // ------------------------------------------------------------------
    // Backups
    // ------------------------------------------------------------------

    [[nodiscard]] Result<std::vector<Backup>, Error> list_backups(const std::string& map_id);
    [[nodiscard]] Result<std::optional<Backup>, Error> get_backup(const std::string& backup_ref);

    /**
     * Re-apply a backup as a new local edit of its map.
     */
    [[nodiscard]] Result<Map, Error> restore_backup(const std::string& backup_ref);

    [[nodiscard]] Result<std::vector<ResolutionEntry>, Error> resolution_log(const std::string& map_id = {});

    // ------------------------------------------------------------------
    // Sync bookkeeping (worker, resolver and switcher)
    // ------------------------------------------------------------------

    [[nodiscard]] Result<std::optional<MapSyncState>, Error> sync_state(const std::string& map_id);
    [[nodiscard]] Result<std::vector<MapSyncState>, Error> sync_states(const std::string& vault_id);

    [[nodiscard]] Result<std::optional<SyncOperation>, Error> pending_operation(const std::string& map_id);
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> due_operations(Timestamp now, int limit);
    [[nodiscard]] Result<int, Error> pending_count();
    [[nodiscard]] Result<std::optional<Timestamp>, Error> next_attempt_time();

    [[nodiscard]] Result<bool, Error> complete_operation(const std::string& map_id, int64_t seq);
    [[nodiscard]] Result<void, Error> reschedule_operation(const std::string& map_id, int64_t seq,
                                                           int attempts, Timestamp next_attempt_at);
    [[nodiscard]] Result<void, Error> reset_backoff();

    /**
     * Record a successful push of `op` that produced `revision`: the
     * operation is completed, last_synced_at becomes the pushed snapshot's
     * modification time, and any newer queued version now builds on
     * `revision`. Returns Pending if the map changed while pushing.
     */
    [[nodiscard]] Result<SyncStatus, Error> record_push(const SyncOperation& op,
                                                        const std::string& revision);

    [[nodiscard]] Result<void, Error> set_sync_status(
        const std::string& map_id,
        SyncStatus status,
        const std::optional<std::string>& error = std::nullopt);

    /**
     * Store a remote copy as clean. Refuses (returns false) when the local
     * copy has unsynchronized changes or a queued operation.
     */
    [[nodiscard]] Result<bool, Error> apply_remote(Map remote, const std::string& revision);

    /**
     * The remote copy won a conflict. Backs up the local copy, replaces it
     * with `remote`, logs the resolution and drops the queued operation,
     * all in one transaction.
     *
     * `expected_local_modified_at` is the local modification time the
     * decision was based on (unset when there was no local map). If the
     * local map changed since, nothing is written and a Conflict error is
     * returned. Returns the backup ref when a local copy was backed up.
     */
    [[nodiscard]] Result<std::optional<std::string>, Error> adopt_remote(
        Map remote,
        const std::string& revision,
        std::optional<Timestamp> expected_local_modified_at);

    /**
     * The local copy won a conflict and overwrote `remote_copy` on the
     * backend. Keeps `remote_copy` as a backup and logs the resolution.
     * Returns the backup ref.
     */
    [[nodiscard]] Result<std::string, Error> record_local_win(const Map& remote_copy);

    /**
     * A queued deletion met a newer remote copy after its vault was deleted
     * here. Keeps the remote copy as a backup and completes the deletion.
     * Returns the backup ref.
     */
    [[nodiscard]] Result<std::string, Error> shelve_orphaned_remote(const SyncOperation& op,
                                                                    const Map& remote_copy);

    /**
     * Remove a map deleted remotely, provided it has nothing to push.
     */
    [[nodiscard]] Result<bool, Error> remove_synced_map(const std::string& map_id);

    /**
     * Drop the vault's clean maps from disk and from the map cache and mark
     * it uncached. Maps with unsynchronized changes stay.
     */
    [[nodiscard]] Result<int, Error> evict_vault(const std::string& vault_id);

    /**
     * Drop every local map and queued operation of the vault.
     */
    [[nodiscard]] Result<void, Error> purge_vault(const std::string& vault_id);

    /**
     * Queue an operation for every dirty map that has none (startup
     * recovery). Returns the number of operations queued.
     */
    [[nodiscard]] Result<int, Error> rebuild_queue();

    // ------------------------------------------------------------------
    // Vault locks
    // ------------------------------------------------------------------

    // Stable id of this installation; lock markers name it as holder.
    [[nodiscard]] Result<std::string, Error> device_id();

    /**
     * Local lock marker, used when no backend is shared. Store `candidate`
     * unless another unexpired lock exists. Returns the
     * current holder when the lock could not be taken.
     */
    [[nodiscard]] Result<std::optional<Lock>, Error> try_lock_vault(const Lock& candidate);
    [[nodiscard]] Result<bool, Error> unlock_vault(const Lock& lock);
    [[nodiscard]] Result<std::optional<Lock>, Error> vault_lock(const std::string& vault_id);

    [[nodiscard]] size_t cached_map_count() const;

private:
    using Edit = std::function<Result<void, Error>(Map&)>;

    Database db_;
    const Clock& clock_;
    VaultRepository vaults_;
    MapRepository maps_;
    QueueRepository queue_;
    BackupRepository backups_;
    LockRepository locks_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Map> cache_;
    std::optional<std::string> device_id_;

    [[nodiscard]] Result<void, Error> initialize();

    [[nodiscard]] Timestamp next_modification(const Map& map) const;
    [[nodiscard]] Result<Map, Error> load_existing(const std::string& map_id);
    [[nodiscard]] Result<Map, Error> mutate(const std::string& map_id, const Edit& edit);
    [[nodiscard]] Result<void, Error> save_and_enqueue(Map& map);
    [[nodiscard]] Result<SyncOperation, Error> enqueue_delete(const MapSyncState& state);
    void forget(const std::string& map_id);
};

} // namespace mindsync::storage
