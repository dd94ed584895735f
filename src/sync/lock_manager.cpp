#include "sync/lock_manager.hpp"
#include "core/log.hpp"

namespace mindsync::sync {

Result<Lock, Error> LockManager::acquire(
    const std::string& vault_id,
    const std::string& operation,
    std::chrono::milliseconds lease
) {
    if (lease.count() <= 0) {
        return Result<Lock, Error>::err(Error{ErrorKind::InvalidArgument, "Lock lease must be positive"});
    }

    auto device = store_.device_id();
    if (device.is_err()) {
        return propagate<Lock>(device);
    }

    const auto now = store_.clock().now();
    Lock candidate{
        .lock_id = new_id(),
        .vault_id = vault_id,
        .acquired_at = now,
        .expires_at = now + lease,
        .operation = operation,
        .device_id = device.unwrap()
    };

    auto holder = remote_ ? remote_->try_lock(candidate) : store_.try_lock_vault(candidate);
    if (holder.is_err()) {
        return propagate<Lock>(holder);
    }
    if (const auto& current = holder.unwrap()) {
        qCDebug(mindsyncVaultLog) << "Vault" << qs(vault_id) << "is locked by device" << qs(current->device_id)
                                  << "for" << qs(current->operation)
                                  << "until" << qs(current->expires_at.to_iso_string());
        return Result<Lock, Error>::err(Error{ErrorKind::LockHeld,
            "Vault " + vault_id + " is locked for " + current->operation +
            " until " + current->expires_at.to_iso_string()});
    }

    qCDebug(mindsyncVaultLog) << "Acquired lock" << qs(candidate.lock_id) << "on vault" << qs(vault_id)
                              << "for" << qs(operation);
    return Result<Lock, Error>::ok(std::move(candidate));
}

Result<void, Error> LockManager::release(const Lock& lock) {
    auto removed = remote_ ? remote_->release_lock(lock) : store_.unlock_vault(lock);
    if (removed.is_err()) {
        return propagate<void>(removed);
    }
    if (!removed.unwrap()) {
        qCDebug(mindsyncVaultLog) << "Lock" << qs(lock.lock_id) << "on vault" << qs(lock.vault_id)
                                  << "was already gone";
    }
    return Result<void, Error>::ok();
}

Result<LockStatus, Error> LockManager::is_locked(const std::string& vault_id) {
    auto current = remote_ ? remote_->read_lock(vault_id) : store_.vault_lock(vault_id);
    if (current.is_err()) {
        return propagate<LockStatus>(current);
    }

    auto lock = std::move(current).unwrap();
    if (!lock || lock->expired_at(store_.clock().now())) {
        return Result<LockStatus, Error>::ok(LockStatus{.locked = false, .holder = std::nullopt});
    }
    return Result<LockStatus, Error>::ok(LockStatus{.locked = true, .holder = std::move(lock)});
}

LockGuard::~LockGuard() {
    if (!lock_) return;
    release().inspect_err([](const Error& e) {
        qCWarning(mindsyncVaultLog) << "Failed to release vault lock:" << qs(e.message);
    });
}

Result<void, Error> LockGuard::release() {
    if (!lock_) {
        return Result<void, Error>::ok();
    }
    auto lock = std::move(*lock_);
    lock_.reset();
    return manager_->release(lock);
}

} // namespace mindsync::sync
