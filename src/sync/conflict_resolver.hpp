#pragma once

#include "sync/events.hpp"
#include "remote/remote_adapter.hpp"
#include "storage/local_store.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <string>

namespace mindsync::sync {

/**
 * Whether a local winner is written to the backend right away.
 * Reconciliation during vault open defers the push to the worker.
 */
enum class PushPolicy {
    PushNow,
    DeferPush
};

enum class ResolutionOutcome {
    Converged,      // both sides already held the same content
    LocalPushed,    // local copy was newer and now is the remote copy
    RemoteAdopted,  // remote copy was newer (or tied) and replaced local
    Deferred,       // local copy is newer; its operation stays queued
    Retry           // the situation changed underneath; try again later
};

struct Resolution {
    ResolutionOutcome outcome{ResolutionOutcome::Retry};
    SyncStatus status{SyncStatus::Pending};
    std::optional<Winner> winner;
    std::optional<std::string> backup_ref;
};

/**
 * ConflictResolver - Latest-write-wins over whole maps.
 *
 * The side with the later modification time wins; a tie goes to the
 * remote copy so every device settles on the same content. The losing
 * version is kept as a backup in the local store and every decision is
 * written to the resolution log.
 *
 * A map deleted remotely while it was edited locally is recreated from
 * the local copy. A map deleted locally is restored if the remote copy
 * changed after the deletion.
 */
class ConflictResolver {
public:
    ConflictResolver(storage::LocalStore& store, remote::RemoteAdapter& remote, EventSink& events)
        : store_(store), remote_(remote), events_(events) {}

    [[nodiscard]] Result<Resolution, Error> resolve(
        const std::string& vault_id,
        const std::string& map_id,
        PushPolicy policy);

private:
    storage::LocalStore& store_;
    remote::RemoteAdapter& remote_;
    EventSink& events_;

    [[nodiscard]] Result<Resolution, Error> push_local(
        const Map& local,
        const SyncOperation& op,
        const std::optional<remote::RemoteFile>& overwritten,
        PushPolicy policy);

    [[nodiscard]] Result<Resolution, Error> adopt_remote(
        const std::string& vault_id,
        const remote::RemoteFile& remote_file,
        const std::optional<Map>& local);

    [[nodiscard]] Result<Resolution, Error> resolve_local_deletion(
        const std::string& vault_id,
        const SyncOperation& op,
        const std::optional<remote::RemoteFile>& remote_file,
        PushPolicy policy);
};

} // namespace mindsync::sync
