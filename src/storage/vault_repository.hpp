#pragma once

#include "storage/database.hpp"
#include "core/map.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace mindsync::storage {

/**
 * VaultRepository - Data access layer for vault metadata.
 *
 * Vault rows are kept for every vault the device has ever seen, cached or
 * not; map_count is derived from the maps table on read.
 */
class VaultRepository {
public:
    explicit VaultRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Vault>, Error> get(const std::string& id);
    [[nodiscard]] Result<std::vector<Vault>, Error> list();

    /**
     * Save a vault (insert or update).
     */
    [[nodiscard]] Result<void, Error> save(const Vault& vault);

    [[nodiscard]] Result<void, Error> remove(const std::string& id);

    [[nodiscard]] Result<void, Error> set_last_opened(const std::string& id, Timestamp at);

    /**
     * Record a completed reconciliation. full_sync_at unset marks the
     * vault as no longer cached.
     */
    [[nodiscard]] Result<void, Error> set_sync_state(
        const std::string& id,
        Timestamp remote_timestamp,
        std::optional<Timestamp> full_sync_at);

    [[nodiscard]] Result<void, Error> set_remote_timestamp(const std::string& id, Timestamp remote_timestamp);

    [[nodiscard]] Result<void, Error> clear_full_sync(const std::string& id);

private:
    Database& db_;

    [[nodiscard]] Vault row_to_vault(Statement& stmt);
    [[nodiscard]] Result<void, Error> run(Statement& stmt);
};

} // namespace mindsync::storage
