#pragma once

#include "core/map.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mindsync {

enum class OperationKind {
    Create,
    Update,
    Delete
};

[[nodiscard]] constexpr std::string_view operation_kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::Create: return "create";
        case OperationKind::Update: return "update";
        case OperationKind::Delete: return "delete";
    }
    return "update";
}

[[nodiscard]] inline std::optional<OperationKind> operation_kind_from_name(std::string_view name) {
    if (name == "create") return OperationKind::Create;
    if (name == "update") return OperationKind::Update;
    if (name == "delete") return OperationKind::Delete;
    return std::nullopt;
}

/**
 * SyncOperation - A queued local mutation awaiting propagation.
 *
 * seq is assigned by the queue and identifies this particular version of
 * the map's pending operation; base_revision is the remote revision the
 * local copy had observed when the operation was first queued.
 */
struct SyncOperation {
    int64_t seq{0};
    OperationKind kind{OperationKind::Update};
    std::string vault_id;
    std::string map_id;
    Timestamp enqueued_at;
    std::optional<Map> payload;
    std::string base_revision;
    int attempts{0};
    Timestamp next_attempt_at;

    bool operator==(const SyncOperation&) const = default;
};

/**
 * Fold a newer operation for the same map into the pending one.
 *
 * Only the final state is ever sent. A create that never reached the
 * backend stays a create; retry bookkeeping of the pending row is kept.
 */
[[nodiscard]] inline SyncOperation coalesce(const SyncOperation& pending, SyncOperation incoming) {
    if (pending.kind == OperationKind::Create && incoming.kind == OperationKind::Update) {
        incoming.kind = OperationKind::Create;
    }
    incoming.base_revision = pending.base_revision;
    incoming.attempts = pending.attempts;
    incoming.next_attempt_at = pending.next_attempt_at;
    return incoming;
}

enum class SyncStatus {
    Clean,
    Pending,
    Conflicted,
    Syncing
};

[[nodiscard]] constexpr std::string_view sync_status_name(SyncStatus status) {
    switch (status) {
        case SyncStatus::Clean: return "clean";
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Conflicted: return "conflicted";
        case SyncStatus::Syncing: return "syncing";
    }
    return "pending";
}

[[nodiscard]] inline SyncStatus sync_status_from_name(std::string_view name) {
    if (name == "clean") return SyncStatus::Clean;
    if (name == "conflicted") return SyncStatus::Conflicted;
    if (name == "syncing") return SyncStatus::Syncing;
    return SyncStatus::Pending;
}

/**
 * Lock - Advisory, time-boxed marker serializing full-vault reconciliation.
 */
struct Lock {
    std::string lock_id;
    std::string vault_id;
    Timestamp acquired_at;
    Timestamp expires_at;
    std::string operation;
    std::string device_id;  // installation holding the lock

    [[nodiscard]] bool expired_at(Timestamp now) const { return now > expires_at; }

    bool operator==(const Lock&) const = default;
};

struct LockStatus {
    bool locked{false};
    std::optional<Lock> holder;
};

enum class Winner {
    Local,
    Remote
};

[[nodiscard]] constexpr std::string_view winner_name(Winner winner) {
    return winner == Winner::Local ? "local" : "remote";
}

/**
 * ResolutionEntry - Audit record of one conflict decision.
 */
struct ResolutionEntry {
    int64_t id{0};
    std::string map_id;
    std::string vault_id;
    Winner winner{Winner::Remote};
    std::optional<std::string> backup_ref;
    Timestamp resolved_at;
};

/**
 * Backup - Snapshot of a local map taken before a remote copy replaced it.
 */
struct Backup {
    std::string backup_ref;
    std::string map_id;
    std::string vault_id;
    Timestamp created_at;
    Map payload;
};

[[nodiscard]] inline std::string make_backup_ref(const std::string& map_id, Timestamp at) {
    return map_id + "@" + std::to_string(at.millis());
}

/**
 * SyncReport - Outcome of one worker cycle.
 */
struct SyncReport {
    int synced{0};
    int failed{0};
    int conflicts{0};
    std::vector<std::string> errors;

    [[nodiscard]] bool success() const { return failed == 0; }
};

} // namespace mindsync
