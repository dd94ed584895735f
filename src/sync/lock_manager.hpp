#pragma once

#include "storage/local_store.hpp"
#include "remote/remote_adapter.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace mindsync::sync {

/**
 * LockManager - Advisory per-vault locks for full reconciliation.
 *
 * With a backend, the lock is a marker written through the remote
 * adapter in one atomic step, so every device sharing the backend sees
 * the same holder. Without one (single-device bootstrap) it is a row in
 * the local store. Either way a lock is a lease: once now > expires_at it
 * is treated as free and the next acquire overwrites it, whoever created
 * it.
 */
class LockManager {
public:
    explicit LockManager(storage::LocalStore& store) : store_(store) {}
    LockManager(storage::LocalStore& store, remote::RemoteAdapter& remote)
        : store_(store), remote_(&remote) {}

    /**
     * Take the vault's lock for `lease`. Fails with ErrorKind::LockHeld
     * while another unexpired lock exists.
     */
    [[nodiscard]] Result<Lock, Error> acquire(
        const std::string& vault_id,
        const std::string& operation,
        std::chrono::milliseconds lease);

    /**
     * Release a lock. Releasing one that was already overwritten after
     * expiring is not an error.
     */
    [[nodiscard]] Result<void, Error> release(const Lock& lock);

    [[nodiscard]] Result<LockStatus, Error> is_locked(const std::string& vault_id);

private:
    storage::LocalStore& store_;
    remote::RemoteAdapter* remote_{nullptr};
};

/**
 * LockGuard - Releases a held lock when it goes out of scope.
 */
class LockGuard {
public:
    LockGuard(LockManager& manager, Lock lock) : manager_(&manager), lock_(std::move(lock)) {}
    ~LockGuard();

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    [[nodiscard]] const Lock& lock() const { return *lock_; }

    /**
     * Release now and report the outcome; the destructor does nothing
     * afterwards.
     */
    [[nodiscard]] Result<void, Error> release();

private:
    LockManager* manager_;
    std::optional<Lock> lock_;
};

} // namespace mindsync::sync
