#include "sync/conflict_resolver.hpp"
#include "core/log.hpp"

namespace mindsync::sync {

namespace {

Resolution retry() {
    return Resolution{
        .outcome = ResolutionOutcome::Retry,
        .status = SyncStatus::Pending,
        .winner = std::nullopt,
        .backup_ref = std::nullopt
    };
}

} // namespace

Result<Resolution, Error> ConflictResolver::resolve(
    const std::string& vault_id,
    const std::string& map_id,
    PushPolicy policy
) {
    auto local_result = store_.get_map(map_id);
    if (local_result.is_err()) {
        return propagate<Resolution>(local_result);
    }
    const auto local = std::move(local_result).unwrap();

    auto pending_result = store_.pending_operation(map_id);
    if (pending_result.is_err()) {
        return propagate<Resolution>(pending_result);
    }
    const auto pending = std::move(pending_result).unwrap();

    std::optional<remote::RemoteFile> remote_file;
    auto read = remote_.read_file(vault_id, map_id);
    if (read.is_ok()) {
        remote_file = std::move(read).unwrap();
    } else if (!read.unwrap_err().is(ErrorKind::NotFound)) {
        return propagate<Resolution>(read);
    }

    if (!local) {
        if (pending && pending->kind == OperationKind::Delete) {
            return resolve_local_deletion(vault_id, *pending, remote_file, policy);
        }
        if (remote_file) {
            return adopt_remote(vault_id, *remote_file, std::nullopt);
        }
        return Result<Resolution, Error>::ok(Resolution{
            .outcome = ResolutionOutcome::Converged,
            .status = SyncStatus::Clean,
            .winner = std::nullopt,
            .backup_ref = std::nullopt
        });
    }

    SyncOperation op = pending.value_or(SyncOperation{
        .seq = 0,
        .kind = OperationKind::Update,
        .vault_id = vault_id,
        .map_id = map_id,
        .enqueued_at = local->local_modified_at,
        .payload = std::nullopt,
        .base_revision = local->remote_revision,
        .attempts = 0,
        .next_attempt_at = Timestamp{}
    });
    if (!op.payload) op.payload = *local;

    if (!remote_file) {
        if (!local->is_dirty() && !pending) {
            // Deleted by another device, nothing local to keep.
            auto removed = store_.remove_synced_map(map_id);
            if (removed.is_err()) {
                return propagate<Resolution>(removed);
            }
            qCInfo(mindsyncSyncLog) << "Map" << qs(map_id) << "was deleted remotely";
            return Result<Resolution, Error>::ok(Resolution{
                .outcome = ResolutionOutcome::RemoteAdopted,
                .status = SyncStatus::Clean,
                .winner = Winner::Remote,
                .backup_ref = std::nullopt
            });
        }
        qCInfo(mindsyncSyncLog) << "Map" << qs(map_id) << "was deleted remotely but edited here; recreating";
        return push_local(*local, op, std::nullopt, policy);
    }

    if (same_content(*local, remote_file->map)) {
        auto status = store_.record_push(op, remote_file->revision);
        if (status.is_err()) {
            return propagate<Resolution>(status);
        }
        qCDebug(mindsyncSyncLog) << "Map" << qs(map_id) << "already converged at" << qs(remote_file->revision);
        return Result<Resolution, Error>::ok(Resolution{
            .outcome = ResolutionOutcome::Converged,
            .status = status.unwrap(),
            .winner = std::nullopt,
            .backup_ref = std::nullopt
        });
    }

    if (local->local_modified_at > remote_file->modified_time) {
        qCInfo(mindsyncSyncLog) << "Conflict on map" << qs(map_id) << ": local copy is newer";
        return push_local(*local, op, remote_file, policy);
    }

    qCInfo(mindsyncSyncLog) << "Conflict on map" << qs(map_id) << ": remote copy is newer";
    return adopt_remote(vault_id, *remote_file, local);
}

Result<Resolution, Error> ConflictResolver::push_local(
    const Map& local,
    const SyncOperation& op,
    const std::optional<remote::RemoteFile>& overwritten,
    PushPolicy policy
) {
    if (policy == PushPolicy::DeferPush) {
        return Result<Resolution, Error>::ok(Resolution{
            .outcome = ResolutionOutcome::Deferred,
            .status = SyncStatus::Pending,
            .winner = Winner::Local,
            .backup_ref = std::nullopt
        });
    }

    const std::string expected = overwritten ? overwritten->revision : std::string{};
    auto written = remote_.write_file(local.vault_id, local.id, *op.payload, expected);
    if (written.is_err()) {
        if (written.unwrap_err().is(ErrorKind::Conflict)) {
            return Result<Resolution, Error>::ok(retry());
        }
        return propagate<Resolution>(written);
    }

    auto status = store_.record_push(op, written.unwrap().revision);
    if (status.is_err()) {
        return propagate<Resolution>(status);
    }

    std::optional<std::string> backup_ref;
    if (overwritten) {
        auto recorded = store_.record_local_win(overwritten->map);
        if (recorded.is_err()) {
            return propagate<Resolution>(recorded);
        }
        backup_ref = recorded.unwrap();
    }

    events_.conflict_resolved(ConflictEvent{
        .map_id = local.id,
        .vault_id = local.vault_id,
        .winner = Winner::Local,
        .backup_ref = backup_ref
    });
    return Result<Resolution, Error>::ok(Resolution{
        .outcome = ResolutionOutcome::LocalPushed,
        .status = status.unwrap(),
        .winner = Winner::Local,
        .backup_ref = std::move(backup_ref)
    });
}

Result<Resolution, Error> ConflictResolver::adopt_remote(
    const std::string& vault_id,
    const remote::RemoteFile& remote_file,
    const std::optional<Map>& local
) {
    Map incoming = remote_file.map;
    incoming.vault_id = vault_id;
    incoming.local_modified_at = remote_file.modified_time;

    std::optional<Timestamp> expected;
    if (local) expected = local->local_modified_at;

    auto adopted = store_.adopt_remote(std::move(incoming), remote_file.revision, expected);
    if (adopted.is_err()) {
        if (adopted.unwrap_err().is(ErrorKind::Conflict)) {
            qCDebug(mindsyncSyncLog) << "Map" << qs(remote_file.map.id) << "changed during resolution; retrying";
            return Result<Resolution, Error>::ok(retry());
        }
        return propagate<Resolution>(adopted);
    }

    auto backup_ref = std::move(adopted).unwrap();
    events_.conflict_resolved(ConflictEvent{
        .map_id = remote_file.map.id,
        .vault_id = vault_id,
        .winner = Winner::Remote,
        .backup_ref = backup_ref
    });
    return Result<Resolution, Error>::ok(Resolution{
        .outcome = ResolutionOutcome::RemoteAdopted,
        .status = SyncStatus::Clean,
        .winner = Winner::Remote,
        .backup_ref = std::move(backup_ref)
    });
}

Result<Resolution, Error> ConflictResolver::resolve_local_deletion(
    const std::string& vault_id,
    const SyncOperation& op,
    const std::optional<remote::RemoteFile>& remote_file,
    PushPolicy policy
) {
    if (!remote_file) {
        auto completed = store_.complete_operation(op.map_id, op.seq);
        if (completed.is_err()) {
            return propagate<Resolution>(completed);
        }
        return Result<Resolution, Error>::ok(Resolution{
            .outcome = ResolutionOutcome::Converged,
            .status = SyncStatus::Clean,
            .winner = std::nullopt,
            .backup_ref = std::nullopt
        });
    }

    if (remote_file->modified_time > op.enqueued_at) {
        auto vault = store_.get_vault(vault_id);
        if (vault.is_err()) {
            return propagate<Resolution>(vault);
        }
        if (!vault.unwrap()) {
            // No vault left to restore into.
            auto shelved = store_.shelve_orphaned_remote(op, remote_file->map);
            if (shelved.is_err()) {
                return propagate<Resolution>(shelved);
            }
            qCInfo(mindsyncSyncLog) << "Map" << qs(op.map_id) << "changed remotely after its vault was deleted;"
                                    << "kept as backup" << qs(shelved.unwrap());
            return Result<Resolution, Error>::ok(Resolution{
                .outcome = ResolutionOutcome::Converged,
                .status = SyncStatus::Clean,
                .winner = Winner::Remote,
                .backup_ref = shelved.unwrap()
            });
        }
        qCInfo(mindsyncSyncLog) << "Map" << qs(op.map_id) << "changed remotely after local deletion; restoring";
        return adopt_remote(vault_id, *remote_file, std::nullopt);
    }

    if (policy == PushPolicy::DeferPush) {
        return Result<Resolution, Error>::ok(Resolution{
            .outcome = ResolutionOutcome::Deferred,
            .status = SyncStatus::Pending,
            .winner = Winner::Local,
            .backup_ref = std::nullopt
        });
    }

    auto deleted = remote_.delete_file(vault_id, op.map_id);
    if (deleted.is_err() && !deleted.unwrap_err().is(ErrorKind::NotFound)) {
        return propagate<Resolution>(deleted);
    }
    auto completed = store_.complete_operation(op.map_id, op.seq);
    if (completed.is_err()) {
        return propagate<Resolution>(completed);
    }
    auto recorded = store_.record_local_win(remote_file->map);
    if (recorded.is_err()) {
        return propagate<Resolution>(recorded);
    }

    events_.conflict_resolved(ConflictEvent{
        .map_id = op.map_id,
        .vault_id = vault_id,
        .winner = Winner::Local,
        .backup_ref = recorded.unwrap()
    });
    return Result<Resolution, Error>::ok(Resolution{
        .outcome = ResolutionOutcome::LocalPushed,
        .status = SyncStatus::Clean,
        .winner = Winner::Local,
        .backup_ref = recorded.unwrap()
    });
}

} // namespace mindsync::sync
