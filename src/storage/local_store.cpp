#include "storage/local_store.hpp"
#include "storage/migrations.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace mindsync::storage {

namespace {

Error not_found(const std::string& what, const std::string& id) {
    return Error{ErrorKind::NotFound, what + " not found: " + id};
}

Error invalid(const std::string& message) {
    return Error{ErrorKind::InvalidArgument, message};
}

} // namespace

LocalStore::LocalStore(Database db, const Clock& clock)
    : db_(std::move(db))
    , clock_(clock)
    , vaults_(db_)
    , maps_(db_)
    , queue_(db_)
    , backups_(db_)
    , locks_(db_) {}

Result<std::unique_ptr<LocalStore>, Error> LocalStore::open(const std::string& path, const Clock& clock) {
    auto db_result = Database::open(path);
    if (db_result.is_err()) {
        return propagate<std::unique_ptr<LocalStore>>(db_result);
    }

    auto store = std::make_unique<LocalStore>(std::move(db_result).unwrap(), clock);
    auto init = store->initialize();
    if (init.is_err()) {
        return propagate<std::unique_ptr<LocalStore>>(init);
    }
    qCInfo(mindsyncStoreLog) << "Opened local store" << qs(path);
    return Result<std::unique_ptr<LocalStore>, Error>::ok(std::move(store));
}

Result<std::unique_ptr<LocalStore>, Error> LocalStore::open_memory(const Clock& clock) {
    return open(":memory:", clock);
}

Result<void, Error> LocalStore::initialize() {
    return initialize_database(db_);
}

Timestamp LocalStore::next_modification(const Map& map) const {
    // Strictly increasing per map, so an edit made in the same millisecond
    // as a completed push still reads as unsynchronized.
    auto floor = std::max(map.local_modified_at, map.last_synced_at) + std::chrono::milliseconds(1);
    return std::max(clock_.now(), floor);
}

void LocalStore::forget(const std::string& map_id) {
    cache_.erase(map_id);
}

Result<Map, Error> LocalStore::load_existing(const std::string& map_id) {
    auto map_result = maps_.get(map_id);
    if (map_result.is_err()) {
        return propagate<Map>(map_result);
    }
    auto map = std::move(map_result).unwrap();
    if (!map) {
        return Result<Map, Error>::err(not_found("Map", map_id));
    }
    return Result<Map, Error>::ok(std::move(*map));
}

Result<void, Error> LocalStore::save_and_enqueue(Map& map) {
    auto saved = maps_.save(map, SyncStatus::Pending);
    if (saved.is_err()) return saved;

    SyncOperation op{
        .seq = 0,
        .kind = map.remote_revision.empty() ? OperationKind::Create : OperationKind::Update,
        .vault_id = map.vault_id,
        .map_id = map.id,
        .enqueued_at = map.local_modified_at,
        .payload = map,
        .base_revision = map.remote_revision,
        .attempts = 0,
        .next_attempt_at = map.local_modified_at
    };
    auto queued = queue_.enqueue(std::move(op));
    if (queued.is_err()) {
        return propagate<void>(queued);
    }
    forget(map.id);
    return Result<void, Error>::ok();
}

Result<SyncOperation, Error> LocalStore::enqueue_delete(const MapSyncState& state) {
    auto now = clock_.now();
    return queue_.enqueue(SyncOperation{
        .seq = 0,
        .kind = OperationKind::Delete,
        .vault_id = state.vault_id,
        .map_id = state.map_id,
        .enqueued_at = std::max(now, state.local_modified_at),
        .payload = std::nullopt,
        .base_revision = state.remote_revision,
        .attempts = 0,
        .next_attempt_at = now
    });
}

Result<Map, Error> LocalStore::mutate(const std::string& map_id, const Edit& edit) {
    std::lock_guard lock(mutex_);

    return db_.transaction([&]() -> Result<Map, Error> {
        auto map_result = load_existing(map_id);
        if (map_result.is_err()) return map_result;
        auto map = std::move(map_result).unwrap();

        auto edited = edit(map);
        if (edited.is_err()) {
            return propagate<Map>(edited);
        }

        auto valid = validate_tree(map);
        if (valid.is_err()) {
            return Result<Map, Error>::err(invalid(valid.unwrap_err().message));
        }

        map.local_modified_at = next_modification(map);
        auto saved = save_and_enqueue(map);
        if (saved.is_err()) {
            return propagate<Map>(saved);
        }
        return Result<Map, Error>::ok(std::move(map));
    });
}

// ============================================================================
// Vaults
// ============================================================================

Result<Vault, Error> LocalStore::create_vault(const std::string& name, const std::string& remote_location) {
    if (name.empty()) {
        return Result<Vault, Error>::err(invalid("Vault name must not be empty"));
    }

    std::lock_guard lock(mutex_);
    Vault vault{
        .id = new_id(),
        .name = name,
        .remote_location = remote_location,
        .last_opened = std::nullopt,
        .last_full_sync = std::nullopt,
        .remote_timestamp = Timestamp{},
        .map_count = 0
    };
    auto saved = vaults_.save(vault);
    if (saved.is_err()) {
        return propagate<Vault>(saved);
    }
    qCInfo(mindsyncStoreLog) << "Created vault" << qs(vault.id) << qs(name);
    return Result<Vault, Error>::ok(std::move(vault));
}

Result<Vault, Error> LocalStore::ensure_vault(const std::string& vault_id) {
    if (vault_id.empty()) {
        return Result<Vault, Error>::err(invalid("Vault id must not be empty"));
    }

    std::lock_guard lock(mutex_);
    auto existing = vaults_.get(vault_id);
    if (existing.is_err()) {
        return propagate<Vault>(existing);
    }
    if (auto vault = std::move(existing).unwrap()) {
        return Result<Vault, Error>::ok(std::move(*vault));
    }

    Vault vault{
        .id = vault_id,
        .name = vault_id,
        .remote_location = {},
        .last_opened = std::nullopt,
        .last_full_sync = std::nullopt,
        .remote_timestamp = Timestamp{},
        .map_count = 0
    };
    auto saved = vaults_.save(vault);
    if (saved.is_err()) {
        return propagate<Vault>(saved);
    }
    qCDebug(mindsyncStoreLog) << "Registered vault" << qs(vault_id);
    return Result<Vault, Error>::ok(std::move(vault));
}

Result<std::optional<Vault>, Error> LocalStore::get_vault(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    return vaults_.get(vault_id);
}

Result<std::vector<Vault>, Error> LocalStore::list_vaults() {
    std::lock_guard lock(mutex_);
    return vaults_.list();
}

Result<void, Error> LocalStore::delete_vault(const std::string& vault_id) {
    std::lock_guard lock(mutex_);

    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto vault = vaults_.get(vault_id);
        if (vault.is_err()) {
            return propagate<void>(vault);
        }
        if (!vault.unwrap()) {
            return Result<void, Error>::err(not_found("Vault", vault_id));
        }

        auto states = maps_.sync_states(vault_id);
        if (states.is_err()) {
            return propagate<void>(states);
        }
        for (const auto& state : states.unwrap()) {
            auto queued = enqueue_delete(state);
            if (queued.is_err()) {
                return propagate<void>(queued);
            }
        }
        return vaults_.remove(vault_id);
    });

    std::erase_if(cache_, [&](const auto& entry) { return entry.second.vault_id == vault_id; });
    if (result.is_ok()) {
        qCInfo(mindsyncStoreLog) << "Deleted vault" << qs(vault_id);
    }
    return result;
}

Result<void, Error> LocalStore::mark_vault_opened(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    return vaults_.set_last_opened(vault_id, clock_.now());
}

Result<void, Error> LocalStore::record_vault_reconciled(const std::string& vault_id, Timestamp remote_timestamp) {
    std::lock_guard lock(mutex_);
    return vaults_.set_sync_state(vault_id, remote_timestamp, clock_.now());
}

Result<void, Error> LocalStore::record_remote_timestamp(const std::string& vault_id, Timestamp remote_timestamp) {
    std::lock_guard lock(mutex_);
    return vaults_.set_remote_timestamp(vault_id, remote_timestamp);
}

// ============================================================================
// Maps
// ============================================================================

Result<Map, Error> LocalStore::create_map(const std::string& vault_id, const std::string& title) {
    std::lock_guard lock(mutex_);

    return db_.transaction([&]() -> Result<Map, Error> {
        auto vault = vaults_.get(vault_id);
        if (vault.is_err()) {
            return propagate<Map>(vault);
        }
        if (!vault.unwrap()) {
            return Result<Map, Error>::err(not_found("Vault", vault_id));
        }

        auto map = mindsync::create_map(new_id(), vault_id, title, clock_.now());
        auto saved = save_and_enqueue(map);
        if (saved.is_err()) {
            return propagate<Map>(saved);
        }
        qCDebug(mindsyncStoreLog) << "Created map" << qs(map.id) << "in vault" << qs(vault_id);
        return Result<Map, Error>::ok(std::move(map));
    });
}

Result<Map, Error> LocalStore::rename_map(const std::string& map_id, const std::string& title) {
    return mutate(map_id, [&](Map& map) -> Result<void, Error> {
        map.title = title;
        return Result<void, Error>::ok();
    });
}

Result<Map, Error> LocalStore::update_node(const std::string& map_id, Node node) {
    if (node.id.empty()) {
        return Result<Map, Error>::err(invalid("Node id must not be empty"));
    }
    if (node.parent_id && *node.parent_id == node.id) {
        return Result<Map, Error>::err(invalid("Node " + node.id + " cannot be its own parent"));
    }

    return mutate(map_id, [&](Map& map) -> Result<void, Error> {
        if (node.parent_id) {
            if (!find_node(map, *node.parent_id)) {
                return Result<void, Error>::err(invalid("Parent node not found: " + *node.parent_id));
            }
            if (find_node(map, node.id) && subtree_ids(map, node.id).contains(*node.parent_id)) {
                return Result<void, Error>::err(invalid(
                    "Moving node " + node.id + " under its own descendant would create a cycle"));
            }
        }
        node.modified_at = next_modification(map);
        map = with_node(std::move(map), std::move(node));
        return Result<void, Error>::ok();
    });
}

Result<Node, Error> LocalStore::add_node(
    const std::string& map_id,
    const std::optional<std::string>& parent_id,
    const std::string& title,
    const std::string& content
) {
    auto node = create_node(new_id(), title, parent_id);
    node.content = content;
    const auto node_id = node.id;

    auto result = mutate(map_id, [&](Map& map) -> Result<void, Error> {
        if (parent_id && !find_node(map, *parent_id)) {
            return Result<void, Error>::err(invalid("Parent node not found: " + *parent_id));
        }
        node.order = static_cast<int>(child_nodes(map, parent_id).size());
        node.modified_at = next_modification(map);
        map.nodes.push_back(node);
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return propagate<Node>(result);
    }
    return Result<Node, Error>::ok(*find_node(result.unwrap(), node_id));
}

Result<Map, Error> LocalStore::remove_node(const std::string& map_id, const std::string& node_id) {
    return mutate(map_id, [&](Map& map) -> Result<void, Error> {
        if (!find_node(map, node_id)) {
            return Result<void, Error>::err(not_found("Node", node_id));
        }
        map = without_subtree(std::move(map), node_id);
        return Result<void, Error>::ok();
    });
}

Result<Edge, Error> LocalStore::add_edge(
    const std::string& map_id,
    const std::string& source,
    const std::string& target,
    EdgeKind kind,
    const std::string& label
) {
    Edge edge{
        .id = new_id(),
        .source = source,
        .target = target,
        .kind = kind,
        .label = label
    };

    auto result = mutate(map_id, [&](Map& map) -> Result<void, Error> {
        if (!find_node(map, source) || !find_node(map, target)) {
            return Result<void, Error>::err(invalid("Edge endpoints must be nodes of map " + map_id));
        }
        map.edges.push_back(edge);
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return propagate<Edge>(result);
    }
    return Result<Edge, Error>::ok(std::move(edge));
}

Result<Map, Error> LocalStore::remove_edge(const std::string& map_id, const std::string& edge_id) {
    return mutate(map_id, [&](Map& map) -> Result<void, Error> {
        auto removed = std::erase_if(map.edges, [&](const Edge& e) { return e.id == edge_id; });
        if (removed == 0) {
            return Result<void, Error>::err(not_found("Edge", edge_id));
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> LocalStore::delete_map(const std::string& map_id) {
    std::lock_guard lock(mutex_);

    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto state = maps_.sync_state(map_id);
        if (state.is_err()) {
            return propagate<void>(state);
        }
        if (!state.unwrap()) {
            return Result<void, Error>::err(not_found("Map", map_id));
        }

        auto queued = enqueue_delete(*state.unwrap());
        if (queued.is_err()) {
            return propagate<void>(queued);
        }
        return maps_.remove(map_id);
    });

    forget(map_id);
    if (result.is_ok()) {
        qCDebug(mindsyncStoreLog) << "Deleted map" << qs(map_id);
    }
    return result;
}

Result<std::vector<MapSummary>, Error> LocalStore::list_maps(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    return maps_.list_by_vault(vault_id);
}

Result<std::optional<Map>, Error> LocalStore::get_map(const std::string& map_id) {
    std::lock_guard lock(mutex_);

    if (auto it = cache_.find(map_id); it != cache_.end()) {
        return Result<std::optional<Map>, Error>::ok(it->second);
    }

    auto map = maps_.get(map_id);
    if (map.is_err()) {
        map.inspect_err([&](const Error& e) {
            if (e.is(ErrorKind::Corruption)) {
                qCWarning(mindsyncStoreLog) << "Map" << qs(map_id) << "is corrupt:" << qs(e.message);
            }
        });
        return map;
    }
    if (map.unwrap()) {
        cache_.insert_or_assign(map_id, *map.unwrap());
    }
    return map;
}

Result<std::vector<SearchResult>, Error> LocalStore::search(const std::string& vault_id, const std::string& query) {
    std::lock_guard lock(mutex_);
    return maps_.search(vault_id, query);
}

// ============================================================================
// Backups
// ============================================================================

Result<std::vector<Backup>, Error> LocalStore::list_backups(const std::string& map_id) {
    std::lock_guard lock(mutex_);
    return backups_.list_by_map(map_id);
}

Result<std::optional<Backup>, Error> LocalStore::get_backup(const std::string& backup_ref) {
    std::lock_guard lock(mutex_);
    return backups_.get(backup_ref);
}

Result<Map, Error> LocalStore::restore_backup(const std::string& backup_ref) {
    std::lock_guard lock(mutex_);

    return db_.transaction([&]() -> Result<Map, Error> {
        auto backup_result = backups_.get(backup_ref);
        if (backup_result.is_err()) {
            return propagate<Map>(backup_result);
        }
        auto backup = std::move(backup_result).unwrap();
        if (!backup) {
            return Result<Map, Error>::err(not_found("Backup", backup_ref));
        }

        auto state = maps_.sync_state(backup->map_id);
        if (state.is_err()) {
            return propagate<Map>(state);
        }

        Map map = std::move(backup->payload);
        map.last_synced_at = Timestamp{};
        map.remote_revision.clear();
        if (const auto& current = state.unwrap()) {
            map.vault_id = current->vault_id;
            map.local_modified_at = current->local_modified_at;
            map.last_synced_at = current->last_synced_at;
            map.remote_revision = current->remote_revision;
        }
        map.local_modified_at = next_modification(map);

        auto saved = save_and_enqueue(map);
        if (saved.is_err()) {
            return propagate<Map>(saved);
        }
        qCInfo(mindsyncStoreLog) << "Restored backup" << qs(backup_ref);
        return Result<Map, Error>::ok(std::move(map));
    });
}

Result<std::vector<ResolutionEntry>, Error> LocalStore::resolution_log(const std::string& map_id) {
    std::lock_guard lock(mutex_);
    return backups_.resolutions(map_id);
}

// ============================================================================
// Sync bookkeeping
// ============================================================================

Result<std::optional<MapSyncState>, Error> LocalStore::sync_state(const std::string& map_id) {
    std::lock_guard lock(mutex_);
    return maps_.sync_state(map_id);
}

Result<std::vector<MapSyncState>, Error> LocalStore::sync_states(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    return maps_.sync_states(vault_id);
}

Result<std::optional<SyncOperation>, Error> LocalStore::pending_operation(const std::string& map_id) {
    std::lock_guard lock(mutex_);
    return queue_.get(map_id);
}

Result<std::vector<SyncOperation>, Error> LocalStore::due_operations(Timestamp now, int limit) {
    std::lock_guard lock(mutex_);
    return queue_.due(now, limit);
}

Result<int, Error> LocalStore::pending_count() {
    std::lock_guard lock(mutex_);
    return queue_.count();
}

Result<std::optional<Timestamp>, Error> LocalStore::next_attempt_time() {
    std::lock_guard lock(mutex_);
    return queue_.next_attempt_time();
}

Result<bool, Error> LocalStore::complete_operation(const std::string& map_id, int64_t seq) {
    std::lock_guard lock(mutex_);
    return queue_.complete(map_id, seq);
}

Result<void, Error> LocalStore::reschedule_operation(
    const std::string& map_id,
    int64_t seq,
    int attempts,
    Timestamp next_attempt_at
) {
    std::lock_guard lock(mutex_);
    return queue_.reschedule(map_id, seq, attempts, next_attempt_at);
}

Result<void, Error> LocalStore::reset_backoff() {
    std::lock_guard lock(mutex_);
    return queue_.reset_backoff();
}

Result<SyncStatus, Error> LocalStore::record_push(const SyncOperation& op, const std::string& revision) {
    if (!op.payload) {
        return Result<SyncStatus, Error>::err(invalid("Pushed operation for " + op.map_id + " has no payload"));
    }

    std::lock_guard lock(mutex_);
    forget(op.map_id);

    return db_.transaction([&]() -> Result<SyncStatus, Error> {
        auto completed = queue_.complete(op.map_id, op.seq);
        if (completed.is_err()) {
            return propagate<SyncStatus>(completed);
        }
        auto rebased = queue_.set_base_revision(op.map_id, revision);
        if (rebased.is_err()) {
            return propagate<SyncStatus>(rebased);
        }

        auto state_result = maps_.sync_state(op.map_id);
        if (state_result.is_err()) {
            return propagate<SyncStatus>(state_result);
        }
        const auto& state = state_result.unwrap();
        if (!state) {
            // Deleted locally while the push was in flight.
            return Result<SyncStatus, Error>::ok(SyncStatus::Pending);
        }

        auto synced_at = std::max(state->last_synced_at, op.payload->local_modified_at);
        auto status = state->local_modified_at > synced_at ? SyncStatus::Pending : SyncStatus::Clean;
        auto updated = maps_.set_synced(op.map_id, synced_at, revision, status);
        if (updated.is_err()) {
            return propagate<SyncStatus>(updated);
        }
        return Result<SyncStatus, Error>::ok(status);
    });
}

Result<void, Error> LocalStore::set_sync_status(
    const std::string& map_id,
    SyncStatus status,
    const std::optional<std::string>& error
) {
    std::lock_guard lock(mutex_);
    return maps_.set_status(map_id, status, error);
}

Result<bool, Error> LocalStore::apply_remote(Map remote, const std::string& revision) {
    std::lock_guard lock(mutex_);
    forget(remote.id);

    return db_.transaction([&]() -> Result<bool, Error> {
        auto state = maps_.sync_state(remote.id);
        if (state.is_err()) {
            return propagate<bool>(state);
        }
        if (const auto& current = state.unwrap(); current && current->is_dirty()) {
            return Result<bool, Error>::ok(false);
        }
        auto pending = queue_.get(remote.id);
        if (pending.is_err()) {
            return propagate<bool>(pending);
        }
        if (pending.unwrap()) {
            return Result<bool, Error>::ok(false);
        }

        remote.last_synced_at = remote.local_modified_at;
        remote.remote_revision = revision;
        auto saved = maps_.save(remote, SyncStatus::Clean);
        if (saved.is_err()) {
            return propagate<bool>(saved);
        }
        return Result<bool, Error>::ok(true);
    });
}

Result<std::optional<std::string>, Error> LocalStore::adopt_remote(
    Map remote,
    const std::string& revision,
    std::optional<Timestamp> expected_local_modified_at
) {
    using R = Result<std::optional<std::string>, Error>;

    std::lock_guard lock(mutex_);
    forget(remote.id);

    return db_.transaction([&]() -> R {
        auto current_result = maps_.get(remote.id);
        if (current_result.is_err()) {
            return propagate<std::optional<std::string>>(current_result);
        }
        const auto& current = current_result.unwrap();

        std::optional<Timestamp> observed;
        if (current) observed = current->local_modified_at;
        if (observed != expected_local_modified_at) {
            return R::err(Error{ErrorKind::Conflict,
                "Map " + remote.id + " changed locally during conflict resolution"});
        }

        const auto now = clock_.now();
        std::optional<std::string> backup_ref;
        if (current) {
            backup_ref = make_backup_ref(current->id, now);
            auto saved = backups_.save(Backup{
                .backup_ref = *backup_ref,
                .map_id = current->id,
                .vault_id = current->vault_id,
                .created_at = now,
                .payload = *current
            });
            if (saved.is_err()) {
                return propagate<std::optional<std::string>>(saved);
            }
        }

        auto vault_id = current ? current->vault_id : remote.vault_id;
        remote.vault_id = vault_id;
        remote.last_synced_at = remote.local_modified_at;
        remote.remote_revision = revision;
        auto replaced = maps_.save(remote, SyncStatus::Clean);
        if (replaced.is_err()) {
            return propagate<std::optional<std::string>>(replaced);
        }

        auto logged = backups_.log_resolution(ResolutionEntry{
            .id = 0,
            .map_id = remote.id,
            .vault_id = vault_id,
            .winner = Winner::Remote,
            .backup_ref = backup_ref,
            .resolved_at = now
        });
        if (logged.is_err()) {
            return propagate<std::optional<std::string>>(logged);
        }

        auto dropped = queue_.remove(remote.id);
        if (dropped.is_err()) {
            return propagate<std::optional<std::string>>(dropped);
        }
        return R::ok(std::move(backup_ref));
    });
}

Result<std::string, Error> LocalStore::shelve_orphaned_remote(const SyncOperation& op, const Map& remote_copy) {
    std::lock_guard lock(mutex_);

    return db_.transaction([&]() -> Result<std::string, Error> {
        const auto now = clock_.now();
        const auto backup_ref = make_backup_ref(remote_copy.id, now);
        auto saved = backups_.save(Backup{
            .backup_ref = backup_ref,
            .map_id = remote_copy.id,
            .vault_id = op.vault_id,
            .created_at = now,
            .payload = remote_copy
        });
        if (saved.is_err()) {
            return propagate<std::string>(saved);
        }

        auto logged = backups_.log_resolution(ResolutionEntry{
            .id = 0,
            .map_id = remote_copy.id,
            .vault_id = op.vault_id,
            .winner = Winner::Remote,
            .backup_ref = backup_ref,
            .resolved_at = now
        });
        if (logged.is_err()) {
            return propagate<std::string>(logged);
        }

        auto completed = queue_.complete(op.map_id, op.seq);
        if (completed.is_err()) {
            return propagate<std::string>(completed);
        }
        return Result<std::string, Error>::ok(backup_ref);
    });
}

Result<std::string, Error> LocalStore::record_local_win(const Map& remote_copy) {
    std::lock_guard lock(mutex_);

    return db_.transaction([&]() -> Result<std::string, Error> {
        const auto now = clock_.now();
        const auto backup_ref = make_backup_ref(remote_copy.id, now);
        auto saved = backups_.save(Backup{
            .backup_ref = backup_ref,
            .map_id = remote_copy.id,
            .vault_id = remote_copy.vault_id,
            .created_at = now,
            .payload = remote_copy
        });
        if (saved.is_err()) {
            return propagate<std::string>(saved);
        }

        auto logged = backups_.log_resolution(ResolutionEntry{
            .id = 0,
            .map_id = remote_copy.id,
            .vault_id = remote_copy.vault_id,
            .winner = Winner::Local,
            .backup_ref = backup_ref,
            .resolved_at = now
        });
        if (logged.is_err()) {
            return propagate<std::string>(logged);
        }
        return Result<std::string, Error>::ok(backup_ref);
    });
}

Result<bool, Error> LocalStore::remove_synced_map(const std::string& map_id) {
    std::lock_guard lock(mutex_);
    forget(map_id);

    return db_.transaction([&]() -> Result<bool, Error> {
        auto state = maps_.sync_state(map_id);
        if (state.is_err()) {
            return propagate<bool>(state);
        }
        if (!state.unwrap() || state.unwrap()->is_dirty()) {
            return Result<bool, Error>::ok(false);
        }
        auto pending = queue_.get(map_id);
        if (pending.is_err()) {
            return propagate<bool>(pending);
        }
        if (pending.unwrap()) {
            return Result<bool, Error>::ok(false);
        }
        auto removed = maps_.remove(map_id);
        if (removed.is_err()) {
            return propagate<bool>(removed);
        }
        return Result<bool, Error>::ok(true);
    });
}

Result<int, Error> LocalStore::evict_vault(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    std::erase_if(cache_, [&](const auto& entry) { return entry.second.vault_id == vault_id; });

    auto result = db_.transaction([&]() -> Result<int, Error> {
        auto removed = maps_.remove_clean_by_vault(vault_id);
        if (removed.is_err()) return removed;
        auto cleared = vaults_.clear_full_sync(vault_id);
        if (cleared.is_err()) {
            return propagate<int>(cleared);
        }
        return removed;
    });
    if (result.is_ok()) {
        qCInfo(mindsyncStoreLog) << "Evicted" << result.unwrap() << "clean maps of vault" << qs(vault_id);
    }
    return result;
}

Result<void, Error> LocalStore::purge_vault(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    std::erase_if(cache_, [&](const auto& entry) { return entry.second.vault_id == vault_id; });

    return db_.transaction([&]() -> Result<void, Error> {
        auto dequeued = queue_.remove_by_vault(vault_id);
        if (dequeued.is_err()) return dequeued;
        auto removed = maps_.remove_by_vault(vault_id);
        if (removed.is_err()) return removed;
        return vaults_.clear_full_sync(vault_id);
    });
}

Result<int, Error> LocalStore::rebuild_queue() {
    std::lock_guard lock(mutex_);

    auto result = db_.transaction([&]() -> Result<int, Error> {
        auto ids = maps_.dirty_without_operation();
        if (ids.is_err()) {
            return propagate<int>(ids);
        }

        int queued = 0;
        for (const auto& map_id : ids.unwrap()) {
            auto map = load_existing(map_id);
            if (map.is_err()) {
                if (!map.unwrap_err().is(ErrorKind::Corruption)) {
                    return propagate<int>(map);
                }
                qCWarning(mindsyncStoreLog) << "Not requeueing corrupt map" << qs(map_id)
                                            << qs(map.unwrap_err().message);
                auto marked = maps_.set_status(map_id, SyncStatus::Pending, map.unwrap_err().message);
                if (marked.is_err()) {
                    return propagate<int>(marked);
                }
                continue;
            }

            auto& value = map.unwrap();
            auto op = queue_.enqueue(SyncOperation{
                .seq = 0,
                .kind = value.remote_revision.empty() ? OperationKind::Create : OperationKind::Update,
                .vault_id = value.vault_id,
                .map_id = value.id,
                .enqueued_at = value.local_modified_at,
                .payload = value,
                .base_revision = value.remote_revision,
                .attempts = 0,
                .next_attempt_at = Timestamp{}
            });
            if (op.is_err()) {
                return propagate<int>(op);
            }
            ++queued;
        }
        return Result<int, Error>::ok(queued);
    });

    if (result.is_ok() && result.unwrap() > 0) {
        qCInfo(mindsyncStoreLog) << "Requeued" << result.unwrap() << "unsynchronized maps";
    }
    return result;
}

// ============================================================================
// Vault locks
// ============================================================================

Result<std::string, Error> LocalStore::device_id() {
    std::lock_guard lock(mutex_);
    if (device_id_) {
        return Result<std::string, Error>::ok(*device_id_);
    }
    auto id = db_.transaction([&]() { return locks_.device_id(); });
    if (id.is_ok()) device_id_ = id.unwrap();
    return id;
}

Result<std::optional<Lock>, Error> LocalStore::try_lock_vault(const Lock& candidate) {
    using R = Result<std::optional<Lock>, Error>;
    std::lock_guard lock(mutex_);

    return db_.transaction([&]() -> R {
        auto stored = locks_.insert_if_free(candidate, clock_.now());
        if (stored.is_err()) {
            return propagate<std::optional<Lock>>(stored);
        }
        if (stored.unwrap()) {
            return R::ok(std::nullopt);
        }
        return locks_.get(candidate.vault_id);
    });
}

Result<bool, Error> LocalStore::unlock_vault(const Lock& lock_record) {
    std::lock_guard lock(mutex_);
    return locks_.remove(lock_record.vault_id, lock_record.lock_id);
}

Result<std::optional<Lock>, Error> LocalStore::vault_lock(const std::string& vault_id) {
    std::lock_guard lock(mutex_);
    return locks_.get(vault_id);
}

size_t LocalStore::cached_map_count() const {
    std::lock_guard lock(mutex_);
    return cache_.size();
}

} // namespace mindsync::storage
