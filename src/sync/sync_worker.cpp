#include "sync/sync_worker.hpp"
#include "sync/backoff.hpp"
#include "core/log.hpp"
#include <set>
#include <utility>

namespace mindsync::sync {

SyncWorker::SyncWorker(storage::LocalStore& store,
                       remote::RemoteAdapter& remote,
                       ConflictResolver& resolver,
                       EventSink& events,
                       SyncConfig config)
    : store_(store)
    , remote_(remote)
    , resolver_(resolver)
    , events_(events)
    , config_(config) {}

SyncReport SyncWorker::run_cycle() {
    SyncReport report;
    std::set<std::pair<std::string, int64_t>> attempted;
    pushed_vaults_.clear();

    while (!stop_requested_.load()) {
        listings_.clear();

        auto due = store_.due_operations(store_.clock().now(), config_.batch_size);
        if (due.is_err()) {
            qCWarning(mindsyncSyncLog) << "Cannot read the operation queue:" << qs(due.unwrap_err().message);
            report.failed++;
            report.errors.push_back(due.unwrap_err().message);
            break;
        }

        bool progressed = false;
        for (const auto& op : due.unwrap()) {
            if (stop_requested_.load()) break;
            if (!attempted.emplace(op.map_id, op.seq).second) continue;
            progressed = true;
            process(op, report);
        }
        if (!progressed) break;
    }
    listings_.clear();

    for (const auto& vault_id : std::exchange(pushed_vaults_, {})) {
        if (stop_requested_.load()) break;
        advance_watermark(vault_id).inspect_err([&](const Error& e) {
            qCDebug(mindsyncSyncLog) << "Vault" << qs(vault_id) << "timestamp not advanced:" << qs(e.message);
        });
    }

    if (report.synced > 0 || report.failed > 0) {
        qCInfo(mindsyncSyncLog) << "Sync cycle:" << report.synced << "synced," << report.failed
                                << "failed," << report.conflicts << "conflicts";
    }
    if (report.failed == 0) {
        last_sync_time_ = store_.clock().now();
    }
    return report;
}

Result<SyncWorker::Listing*, Error> SyncWorker::listing_for(const std::string& vault_id) {
    auto& slot = listings_[vault_id];
    if (!slot) {
        auto files = remote_.list_files(vault_id);
        if (files.is_err()) {
            return propagate<Listing*>(files);
        }
        Listing listing;
        for (auto& file : std::move(files).unwrap()) {
            auto id = file.file_id;
            listing.emplace(std::move(id), std::move(file));
        }
        slot = std::move(listing);
    }
    return Result<Listing*, Error>::ok(&*slot);
}

Result<void, Error> SyncWorker::advance_watermark(const std::string& vault_id) {
    auto vault = store_.get_vault(vault_id);
    if (vault.is_err()) return propagate<void>(vault);
    if (!vault.unwrap()) return Result<void, Error>::ok();

    // Read the timestamp before listing: a change landing in between shows
    // up as a mismatch below, one landing later as a newer timestamp.
    auto changed_at = remote_.get_vault_timestamp(vault_id);
    if (changed_at.is_err()) return propagate<void>(changed_at);
    if (changed_at.unwrap() <= vault.unwrap()->remote_timestamp) return Result<void, Error>::ok();

    auto files = remote_.list_files(vault_id);
    if (files.is_err()) return propagate<void>(files);
    auto states = store_.sync_states(vault_id);
    if (states.is_err()) return propagate<void>(states);

    std::map<std::string, std::string> local;
    for (const auto& state : states.unwrap()) {
        if (!state.remote_revision.empty()) local.emplace(state.map_id, state.remote_revision);
    }
    for (const auto& file : files.unwrap()) {
        auto it = local.find(file.file_id);
        if (it == local.end() || it->second != file.revision) {
            qCDebug(mindsyncSyncLog) << "Vault" << qs(vault_id) << "has remote changes to merge; keeping its timestamp";
            return Result<void, Error>::ok();
        }
        local.erase(it);
    }
    if (!local.empty()) {
        qCDebug(mindsyncSyncLog) << "Vault" << qs(vault_id) << "lost maps remotely; keeping its timestamp";
        return Result<void, Error>::ok();
    }
    return store_.record_remote_timestamp(vault_id, changed_at.unwrap());
}

void SyncWorker::process(const SyncOperation& op, SyncReport& report) {
    qCDebug(mindsyncSyncLog) << "Processing" << qs(std::string(operation_kind_name(op.kind)))
                             << "of map" << qs(op.map_id) << "seq" << op.seq;
    if (op.kind == OperationKind::Delete) {
        process_delete(op, report);
    } else {
        process_upsert(op, report);
    }
}

void SyncWorker::process_upsert(const SyncOperation& op, SyncReport& report) {
    set_status(op.map_id, SyncStatus::Syncing);

    if (!op.payload) {
        fail(op, Error{ErrorKind::Corruption, "Queued operation has no payload"}, report);
        return;
    }

    auto state = store_.sync_state(op.map_id);
    if (state.is_err()) {
        fail(op, state.unwrap_err(), report);
        return;
    }
    if (!state.unwrap()) {
        // Purged locally; nothing left to push.
        store_.complete_operation(op.map_id, op.seq).inspect_err([&](const Error& e) {
            qCWarning(mindsyncSyncLog) << "Cannot drop operation of purged map" << qs(op.map_id) << qs(e.message);
        });
        return;
    }
    const auto observed = state.unwrap()->remote_revision;

    auto listing = listing_for(op.vault_id);
    if (listing.is_err()) {
        fail(op, listing.unwrap_err(), report);
        return;
    }
    auto* files = listing.unwrap();
    auto remote_it = files->find(op.map_id);
    const std::string remote_revision = remote_it == files->end() ? std::string{} : remote_it->second.revision;

    if (remote_revision != observed) {
        apply_resolution(op, resolver_.resolve(op.vault_id, op.map_id, PushPolicy::PushNow), report);
        listings_[op.vault_id].reset();
        return;
    }

    auto written = remote_.write_file(op.vault_id, op.map_id, *op.payload, observed);
    if (written.is_err()) {
        if (written.unwrap_err().is(ErrorKind::Conflict)) {
            apply_resolution(op, resolver_.resolve(op.vault_id, op.map_id, PushPolicy::PushNow), report);
            listings_[op.vault_id].reset();
            return;
        }
        fail(op, written.unwrap_err(), report);
        return;
    }

    const auto& result = written.unwrap();
    (*files)[op.map_id] = remote::RemoteFileInfo{
        .file_id = op.map_id,
        .modified_time = result.modified_time,
        .revision = result.revision
    };

    auto status = store_.record_push(op, result.revision);
    if (status.is_err()) {
        fail(op, status.unwrap_err(), report);
        return;
    }

    report.synced++;
    pushed_vaults_.insert(op.vault_id);
    set_status(op.map_id, status.unwrap());
    qCDebug(mindsyncSyncLog) << "Pushed map" << qs(op.map_id) << "as" << qs(result.revision);
}

void SyncWorker::process_delete(const SyncOperation& op, SyncReport& report) {
    auto listing = listing_for(op.vault_id);
    if (listing.is_err()) {
        fail(op, listing.unwrap_err(), report);
        return;
    }
    auto* files = listing.unwrap();
    auto remote_it = files->find(op.map_id);

    if (remote_it != files->end() && remote_it->second.revision != op.base_revision) {
        apply_resolution(op, resolver_.resolve(op.vault_id, op.map_id, PushPolicy::PushNow), report);
        listings_[op.vault_id].reset();
        return;
    }

    if (remote_it != files->end()) {
        auto deleted = remote_.delete_file(op.vault_id, op.map_id);
        if (deleted.is_err() && !deleted.unwrap_err().is(ErrorKind::NotFound)) {
            fail(op, deleted.unwrap_err(), report);
            return;
        }
        files->erase(remote_it);
    }

    auto completed = store_.complete_operation(op.map_id, op.seq);
    if (completed.is_err()) {
        fail(op, completed.unwrap_err(), report);
        return;
    }
    report.synced++;
    pushed_vaults_.insert(op.vault_id);
    qCDebug(mindsyncSyncLog) << "Deleted remote map" << qs(op.map_id);
}

void SyncWorker::apply_resolution(const SyncOperation& op,
                                  const Result<Resolution, Error>& resolution,
                                  SyncReport& report) {
    if (resolution.is_err()) {
        fail(op, resolution.unwrap_err(), report);
        return;
    }

    const auto& outcome = resolution.unwrap();
    switch (outcome.outcome) {
        case ResolutionOutcome::Retry:
            reschedule(op, op.attempts, config_.backoff_base);
            set_status(op.map_id, SyncStatus::Pending);
            return;
        case ResolutionOutcome::Deferred:
            set_status(op.map_id, SyncStatus::Pending);
            return;
        case ResolutionOutcome::Converged:
        case ResolutionOutcome::LocalPushed:
        case ResolutionOutcome::RemoteAdopted:
            break;
    }

    report.synced++;
    if (outcome.outcome == ResolutionOutcome::LocalPushed) pushed_vaults_.insert(op.vault_id);
    if (outcome.winner) report.conflicts++;
    if (op.kind != OperationKind::Delete || outcome.outcome == ResolutionOutcome::RemoteAdopted) {
        set_status(op.map_id, outcome.status);
    }
}

void SyncWorker::fail(const SyncOperation& op, const Error& error, SyncReport& report) {
    report.failed++;
    report.errors.push_back(op.map_id + ": " + error.message);

    if (error.is(ErrorKind::Network)) {
        qCDebug(mindsyncSyncLog) << "Map" << qs(op.map_id) << "waiting for network:" << qs(error.message);
    } else {
        qCWarning(mindsyncSyncLog) << "Sync of map" << qs(op.map_id) << "failed:"
                                   << qs(std::string(error_kind_name(error.kind))) << qs(error.message);
    }

    if (error.is(ErrorKind::Corruption) && on_corruption) {
        auto local = store_.get_map(op.map_id);
        if (local.is_err() && local.unwrap_err().is(ErrorKind::Corruption)) {
            on_corruption(op.vault_id);
        }
    }

    const int attempts = op.attempts + 1;
    reschedule(op, attempts, backoff_delay(attempts, config_.backoff_base, config_.backoff_cap));
    set_status(op.map_id, SyncStatus::Pending,
               error.is(ErrorKind::Network) ? std::nullopt : std::optional<std::string>(error.message));
}

void SyncWorker::reschedule(const SyncOperation& op, int attempts, std::chrono::milliseconds delay) {
    const auto next = store_.clock().now() + delay;
    store_.reschedule_operation(op.map_id, op.seq, attempts, next).inspect_err([&](const Error& e) {
        qCWarning(mindsyncSyncLog) << "Cannot reschedule map" << qs(op.map_id) << qs(e.message);
    });
}

void SyncWorker::set_status(const std::string& map_id, SyncStatus status,
                            const std::optional<std::string>& error) {
    store_.set_sync_status(map_id, status, error).inspect_err([&](const Error& e) {
        qCWarning(mindsyncSyncLog) << "Cannot record status of map" << qs(map_id) << qs(e.message);
    });
    events_.sync_status_changed(map_id, status);
}

} // namespace mindsync::sync
