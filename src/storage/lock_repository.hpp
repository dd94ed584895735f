#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <string>

namespace mindsync::storage {

/**
 * LockRepository - Rows of the vault_locks table, one per locked vault.
 */
class LockRepository {
public:
    explicit LockRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Lock>, Error> get(const std::string& vault_id);

    /**
     * Store `candidate` unless a lock that has not expired at `now` exists.
     * Returns true when the candidate was stored.
     */
    [[nodiscard]] Result<bool, Error> insert_if_free(const Lock& candidate, Timestamp now);

    /**
     * Delete the lock only if it is still the one identified by lock_id.
     */
    [[nodiscard]] Result<bool, Error> remove(const std::string& vault_id, const std::string& lock_id);

    /**
     * Id of this installation, generated and stored on first use. Locks
     * taken here carry it as their holder.
     */
    [[nodiscard]] Result<std::string, Error> device_id();

private:
    Database& db_;
};

} // namespace mindsync::storage
