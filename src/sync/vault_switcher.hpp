#pragma once

#include "sync/conflict_resolver.hpp"
#include "sync/events.hpp"
#include "sync/lock_manager.hpp"
#include "sync/sync_config.hpp"
#include "remote/remote_adapter.hpp"
#include "storage/local_store.hpp"
#include "core/result.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mindsync::sync {

/**
 * VaultOpenReport - What opening a vault did.
 */
struct VaultOpenReport {
    std::string vault_id;
    bool full_pull{false};
    bool used_cached_state{false};
    int pulled{0};      // maps read from the backend and stored
    int merged{0};      // conflicts decided by the resolver
    int removed{0};     // clean maps deleted remotely
    int skipped{0};     // unchanged or unreadable remote maps
};

/**
 * VaultSwitcher - The current-vault state machine (Closed -> Loading -> Ready).
 *
 * Opening a vault reconciles it with the backend under the vault lock:
 * a vault never cached on this device is pulled completely, a cached one
 * only when the backend reports a newer change, and then map by map.
 * When the lock is held or the backend is unreachable the vault opens on
 * its cached state. Local changes are never pushed from here; they stay
 * queued for the SyncWorker.
 *
 * Runs on the sync thread. cancel() may be called from any thread and is
 * honoured between maps.
 *
 * An open queued for the sync thread takes a ticket() when it is queued;
 * a cancel() issued after that, even before the open starts, aborts it.
 * Without a ticket an open is only cancelled by calls made while it runs.
 */
class VaultSwitcher {
public:
    using Ticket = uint64_t;

    VaultSwitcher(storage::LocalStore& store,
                  remote::RemoteAdapter& remote,
                  ConflictResolver& resolver,
                  LockManager& locks,
                  EventSink& events,
                  SyncConfig config);

    [[nodiscard]] Result<VaultOpenReport, Error> open_vault(const std::string& vault_id,
                                                            std::optional<Ticket> ticket = std::nullopt);

    /**
     * Close the current vault, evicting its clean maps when configured,
     * and open `vault_id`. A vault whose open failed part way is evicted
     * the same way.
     */
    [[nodiscard]] Result<VaultOpenReport, Error> switch_vault(const std::string& vault_id,
                                                              std::optional<Ticket> ticket = std::nullopt);

    /**
     * Drop every local map and queued operation of the vault and pull it
     * again. Used after local corruption.
     */
    [[nodiscard]] Result<VaultOpenReport, Error> repull_vault(const std::string& vault_id,
                                                              std::optional<Ticket> ticket = std::nullopt);

    /**
     * Abort an open in progress. The lock is released; maps already
     * written stay.
     */
    void cancel() { cancel_generation_.fetch_add(1); }

    [[nodiscard]] Ticket ticket() const { return cancel_generation_.load(); }

    [[nodiscard]] std::optional<std::string> current_vault() const;
    [[nodiscard]] VaultState state(const std::string& vault_id) const;

private:
    storage::LocalStore& store_;
    remote::RemoteAdapter& remote_;
    ConflictResolver& resolver_;
    LockManager& locks_;
    EventSink& events_;
    SyncConfig config_;

    std::atomic<Ticket> cancel_generation_{0};
    Ticket active_ticket_{0};  // sync thread only
    mutable std::mutex mutex_;
    std::optional<std::string> current_;
    std::optional<std::string> partial_;  // failed part way through opening
    std::map<std::string, VaultState> states_;

    void set_state(const std::string& vault_id, VaultState state);
    void begin(std::optional<Ticket> ticket);
    void close_previous(const std::string& previous);
    [[nodiscard]] Result<void, Error> check_cancelled(const std::string& vault_id) const;

    /**
     * Take the lock and run `pass`. A held lock yields used_cached_state.
     */
    template<typename Pass>
    [[nodiscard]] Result<void, Error> locked(const std::string& vault_id, const char* operation,
                                             VaultOpenReport& report, Pass&& pass);

    [[nodiscard]] Result<void, Error> full_pull(const std::string& vault_id, VaultOpenReport& report);
    [[nodiscard]] Result<void, Error> merge(const std::string& vault_id, Timestamp remote_timestamp,
                                            VaultOpenReport& report);
    [[nodiscard]] Result<void, Error> pull_file(const std::string& vault_id,
                                                const remote::RemoteFileInfo& info,
                                                VaultOpenReport& report);
    [[nodiscard]] Result<void, Error> resolve_dirty(const std::string& vault_id,
                                                    const std::string& map_id,
                                                    VaultOpenReport& report);
    [[nodiscard]] Result<VaultOpenReport, Error> finish(VaultOpenReport report,
                                                        const Result<void, Error>& outcome);
};

} // namespace mindsync::sync
