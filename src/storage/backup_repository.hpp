#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mindsync::storage {

/**
 * BackupRepository - Conflict backups and the resolution log.
 */
class BackupRepository {
public:
    explicit BackupRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> save(const Backup& backup);
    [[nodiscard]] Result<std::optional<Backup>, Error> get(const std::string& backup_ref);

    /**
     * Backups of one map, newest first.
     */
    [[nodiscard]] Result<std::vector<Backup>, Error> list_by_map(const std::string& map_id);

    [[nodiscard]] Result<ResolutionEntry, Error> log_resolution(ResolutionEntry entry);

    /**
     * Resolution entries, newest first; all maps when map_id is empty.
     */
    [[nodiscard]] Result<std::vector<ResolutionEntry>, Error> resolutions(const std::string& map_id);

private:
    Database& db_;

    [[nodiscard]] Result<Backup, Error> row_to_backup(Statement& stmt);
};

} // namespace mindsync::storage
