#include "sync/vault_switcher.hpp"
#include "core/log.hpp"
#include <unordered_map>
#include <utility>

namespace mindsync::sync {

VaultSwitcher::VaultSwitcher(storage::LocalStore& store,
                             remote::RemoteAdapter& remote,
                             ConflictResolver& resolver,
                             LockManager& locks,
                             EventSink& events,
                             SyncConfig config)
    : store_(store)
    , remote_(remote)
    , resolver_(resolver)
    , locks_(locks)
    , events_(events)
    , config_(config) {}

std::optional<std::string> VaultSwitcher::current_vault() const {
    std::lock_guard lock(mutex_);
    return current_;
}

VaultState VaultSwitcher::state(const std::string& vault_id) const {
    std::lock_guard lock(mutex_);
    auto it = states_.find(vault_id);
    return it == states_.end() ? VaultState::Closed : it->second;
}

void VaultSwitcher::set_state(const std::string& vault_id, VaultState state) {
    {
        std::lock_guard lock(mutex_);
        auto& current = states_[vault_id];
        if (current == state) return;
        current = state;
    }
    qCDebug(mindsyncVaultLog) << "Vault" << qs(vault_id) << "is now"
                              << qs(std::string(vault_state_name(state)));
    events_.vault_state_changed(vault_id, state);
}

void VaultSwitcher::begin(std::optional<Ticket> ticket) {
    active_ticket_ = ticket.value_or(cancel_generation_.load());
}

Result<void, Error> VaultSwitcher::check_cancelled(const std::string& vault_id) const {
    if (cancel_generation_.load() != active_ticket_) {
        return Result<void, Error>::err(Error{ErrorKind::Cancelled, "Opening vault " + vault_id + " was cancelled"});
    }
    return Result<void, Error>::ok();
}

template<typename Pass>
Result<void, Error> VaultSwitcher::locked(const std::string& vault_id, const char* operation,
                                          VaultOpenReport& report, Pass&& pass) {
    auto acquired = locks_.acquire(vault_id, operation, config_.lock_lease);
    if (acquired.is_err()) {
        if (acquired.unwrap_err().is(ErrorKind::LockHeld)) {
            qCInfo(mindsyncVaultLog) << qs(acquired.unwrap_err().message) << "; using cached state";
            report.used_cached_state = true;
            return Result<void, Error>::ok();
        }
        return propagate<void>(acquired);
    }

    LockGuard guard(locks_, std::move(acquired).unwrap());
    auto result = pass();
    guard.release().inspect_err([&](const Error& e) {
        qCWarning(mindsyncVaultLog) << "Cannot release lock on vault" << qs(vault_id) << qs(e.message);
    });
    return result;
}

Result<VaultOpenReport, Error> VaultSwitcher::open_vault(const std::string& vault_id,
                                                         std::optional<Ticket> ticket) {
    begin(ticket);
    if (auto cancelled = check_cancelled(vault_id); cancelled.is_err()) {
        qCInfo(mindsyncVaultLog) << "Open of vault" << qs(vault_id) << "was cancelled before it started";
        return propagate<VaultOpenReport>(cancelled);
    }
    set_state(vault_id, VaultState::Loading);

    VaultOpenReport report{.vault_id = vault_id};

    auto vault_result = store_.ensure_vault(vault_id);
    if (vault_result.is_err()) {
        return finish(std::move(report), propagate<void>(vault_result));
    }
    auto opened = store_.mark_vault_opened(vault_id);
    if (opened.is_err()) {
        return finish(std::move(report), opened);
    }
    {
        std::lock_guard lock(mutex_);
        current_ = vault_id;
        if (partial_ == vault_id) partial_.reset();
    }

    const auto vault = std::move(vault_result).unwrap();
    if (!vault.is_cached()) {
        qCInfo(mindsyncVaultLog) << "Vault" << qs(vault_id) << "is not cached; pulling it";
        report.full_pull = true;
        auto pulled = locked(vault_id, "full-pull", report, [&]() {
            return full_pull(vault_id, report);
        });
        return finish(std::move(report), pulled);
    }

    auto remote_ts = remote_.get_vault_timestamp(vault_id);
    if (remote_ts.is_err()) {
        return finish(std::move(report), propagate<void>(remote_ts));
    }
    if (remote_ts.unwrap() <= vault.remote_timestamp) {
        qCDebug(mindsyncVaultLog) << "Vault" << qs(vault_id) << "is up to date";
        return finish(std::move(report), Result<void, Error>::ok());
    }

    qCInfo(mindsyncVaultLog) << "Vault" << qs(vault_id) << "changed remotely since"
                             << qs(vault.remote_timestamp.to_iso_string()) << "; merging";
    const Timestamp changed_at = remote_ts.unwrap();
    auto merged = locked(vault_id, "merge", report, [&]() {
        return merge(vault_id, changed_at, report);
    });
    return finish(std::move(report), merged);
}

Result<VaultOpenReport, Error> VaultSwitcher::switch_vault(const std::string& vault_id,
                                                           std::optional<Ticket> ticket) {
    std::optional<std::string> previous;
    std::optional<std::string> partial;
    {
        std::lock_guard lock(mutex_);
        previous = current_;
        partial = std::exchange(partial_, std::nullopt);
    }
    if (partial && *partial != vault_id && partial != previous) close_previous(*partial);
    if (previous && *previous != vault_id) close_previous(*previous);
    return open_vault(vault_id, ticket);
}

void VaultSwitcher::close_previous(const std::string& previous) {
    if (config_.evict_on_switch) {
        store_.evict_vault(previous).inspect_err([&](const Error& e) {
            qCWarning(mindsyncVaultLog) << "Cannot evict vault" << qs(previous) << qs(e.message);
        });
    }
    set_state(previous, VaultState::Closed);
}

Result<VaultOpenReport, Error> VaultSwitcher::repull_vault(const std::string& vault_id,
                                                           std::optional<Ticket> ticket) {
    begin(ticket);
    set_state(vault_id, VaultState::Loading);
    qCWarning(mindsyncVaultLog) << "Re-pulling vault" << qs(vault_id);

    VaultOpenReport report{.vault_id = vault_id, .full_pull = true};

    auto vault_result = store_.ensure_vault(vault_id);
    if (vault_result.is_err()) {
        return finish(std::move(report), propagate<void>(vault_result));
    }

    auto pulled = locked(vault_id, "repull", report, [&]() -> Result<void, Error> {
        auto purged = store_.purge_vault(vault_id);
        if (purged.is_err()) return purged;
        return full_pull(vault_id, report);
    });
    return finish(std::move(report), pulled);
}

Result<VaultOpenReport, Error> VaultSwitcher::finish(VaultOpenReport report,
                                                     const Result<void, Error>& outcome) {
    if (outcome.is_err()) {
        const auto& error = outcome.unwrap_err();
        if (!error.is(ErrorKind::Network)) {
            qCWarning(mindsyncVaultLog) << "Opening vault" << qs(report.vault_id) << "failed:" << qs(error.message);
            {
                std::lock_guard lock(mutex_);
                if (current_ == report.vault_id) {
                    partial_ = std::exchange(current_, std::nullopt);
                }
            }
            set_state(report.vault_id, VaultState::Closed);
            return Result<VaultOpenReport, Error>::err(error);
        }
        qCInfo(mindsyncVaultLog) << "Backend unreachable; vault" << qs(report.vault_id)
                                 << "opens on cached state";
        report.used_cached_state = true;
    }

    set_state(report.vault_id, VaultState::Ready);
    return Result<VaultOpenReport, Error>::ok(std::move(report));
}

Result<void, Error> VaultSwitcher::full_pull(const std::string& vault_id, VaultOpenReport& report) {
    // Read the watermark first so changes made while pulling show up next time.
    auto remote_ts = remote_.get_vault_timestamp(vault_id);
    if (remote_ts.is_err()) {
        return propagate<void>(remote_ts);
    }
    auto files = remote_.list_files(vault_id);
    if (files.is_err()) {
        return propagate<void>(files);
    }

    for (const auto& info : files.unwrap()) {
        auto cancelled = check_cancelled(vault_id);
        if (cancelled.is_err()) return cancelled;

        auto pulled = pull_file(vault_id, info, report);
        if (pulled.is_err()) return pulled;
    }

    qCInfo(mindsyncVaultLog) << "Pulled" << report.pulled << "maps of vault" << qs(vault_id);
    return store_.record_vault_reconciled(vault_id, remote_ts.unwrap());
}

Result<void, Error> VaultSwitcher::merge(const std::string& vault_id, Timestamp remote_timestamp,
                                         VaultOpenReport& report) {
    auto files = remote_.list_files(vault_id);
    if (files.is_err()) {
        return propagate<void>(files);
    }
    auto states = store_.sync_states(vault_id);
    if (states.is_err()) {
        return propagate<void>(states);
    }

    std::unordered_map<std::string, const storage::MapSyncState*> local;
    for (const auto& state : states.unwrap()) {
        local.emplace(state.map_id, &state);
    }

    for (const auto& info : files.unwrap()) {
        auto cancelled = check_cancelled(vault_id);
        if (cancelled.is_err()) return cancelled;

        auto it = local.find(info.file_id);
        Result<void, Error> step = Result<void, Error>::ok();
        if (it == local.end()) {
            step = pull_file(vault_id, info, report);
        } else if (it->second->remote_revision == info.revision) {
            report.skipped++;
        } else if (it->second->is_dirty()) {
            step = resolve_dirty(vault_id, info.file_id, report);
        } else {
            step = pull_file(vault_id, info, report);
        }
        if (step.is_err()) return step;
        if (it != local.end()) local.erase(it);
    }

    // Whatever is left no longer exists remotely.
    for (const auto& [map_id, state] : local) {
        auto cancelled = check_cancelled(vault_id);
        if (cancelled.is_err()) return cancelled;

        if (state->is_dirty() || state->remote_revision.empty()) continue;
        auto removed = store_.remove_synced_map(map_id);
        if (removed.is_err()) {
            return propagate<void>(removed);
        }
        if (removed.unwrap()) {
            report.removed++;
            qCDebug(mindsyncVaultLog) << "Removed map" << qs(map_id) << "deleted remotely";
        }
    }

    qCInfo(mindsyncVaultLog) << "Merged vault" << qs(vault_id) << ":" << report.pulled << "pulled,"
                             << report.merged << "resolved," << report.removed << "removed,"
                             << report.skipped << "unchanged";
    return store_.record_vault_reconciled(vault_id, remote_timestamp);
}

Result<void, Error> VaultSwitcher::pull_file(const std::string& vault_id,
                                             const remote::RemoteFileInfo& info,
                                             VaultOpenReport& report) {
    auto read = remote_.read_file(vault_id, info.file_id);
    if (read.is_err()) {
        const auto& error = read.unwrap_err();
        if (error.is(ErrorKind::NotFound)) {
            report.skipped++;
            return Result<void, Error>::ok();
        }
        if (error.is(ErrorKind::Corruption)) {
            qCWarning(mindsyncVaultLog) << "Skipping unreadable remote map" << qs(info.file_id) << qs(error.message);
            report.skipped++;
            return Result<void, Error>::ok();
        }
        return propagate<void>(read);
    }

    auto file = std::move(read).unwrap();
    Map map = std::move(file.map);
    map.vault_id = vault_id;
    map.local_modified_at = file.modified_time;

    auto applied = store_.apply_remote(std::move(map), file.revision);
    if (applied.is_err()) {
        return propagate<void>(applied);
    }
    if (!applied.unwrap()) {
        return resolve_dirty(vault_id, info.file_id, report);
    }

    report.pulled++;
    events_.sync_status_changed(info.file_id, SyncStatus::Clean);
    return Result<void, Error>::ok();
}

Result<void, Error> VaultSwitcher::resolve_dirty(const std::string& vault_id,
                                                 const std::string& map_id,
                                                 VaultOpenReport& report) {
    auto resolution = resolver_.resolve(vault_id, map_id, PushPolicy::DeferPush);
    if (resolution.is_err()) {
        return propagate<void>(resolution);
    }
    const auto& outcome = resolution.unwrap();
    if (outcome.winner) report.merged++;
    events_.sync_status_changed(map_id, outcome.status);
    return Result<void, Error>::ok();
}

} // namespace mindsync::sync
