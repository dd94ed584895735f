#include "storage/backup_repository.hpp"
#include "storage/map_codec.hpp"

namespace mindsync::storage {

Result<Backup, Error> BackupRepository::row_to_backup(Statement& stmt) {
    auto payload = decode_map(stmt.column_text(4));
    if (payload.is_err()) {
        return propagate<Backup>(payload);
    }
    return Result<Backup, Error>::ok(Backup{
        .backup_ref = stmt.column_text(0),
        .map_id = stmt.column_text(1),
        .vault_id = stmt.column_text(2),
        .created_at = stmt.column_timestamp(3),
        .payload = std::move(payload).unwrap()
    });
}

Result<void, Error> BackupRepository::save(const Backup& backup) {
    // Two conflicts on one map within the same millisecond share a ref;
    // the later backup replaces the earlier.
    auto stmt_result = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO backups (backup_ref, map_id, vault_id, created_at, payload)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, backup.backup_ref);
    stmt.bind_text(2, backup.map_id);
    stmt.bind_text(3, backup.vault_id);
    stmt.bind_timestamp(4, backup.created_at);
    stmt.bind_text(5, encode_map(backup.payload));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<void>(step_result);
    }
    return Result<void, Error>::ok();
}

Result<std::optional<Backup>, Error> BackupRepository::get(const std::string& backup_ref) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT backup_ref, map_id, vault_id, created_at, payload
        FROM backups WHERE backup_ref = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::optional<Backup>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, backup_ref);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<Backup>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Backup>, Error>::ok(std::nullopt);
    }

    auto backup = row_to_backup(stmt);
    if (backup.is_err()) {
        return propagate<std::optional<Backup>>(backup);
    }
    return Result<std::optional<Backup>, Error>::ok(std::move(backup).unwrap());
}

Result<std::vector<Backup>, Error> BackupRepository::list_by_map(const std::string& map_id) {
    std::vector<Backup> backups;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT backup_ref, map_id, vault_id, created_at, payload
        FROM backups WHERE map_id = ? ORDER BY created_at DESC;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::vector<Backup>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<Backup>>(step_result);
        }
        if (!step_result.unwrap()) break;

        auto backup = row_to_backup(stmt);
        if (backup.is_err()) {
            return propagate<std::vector<Backup>>(backup);
        }
        backups.push_back(std::move(backup).unwrap());
    }
    return Result<std::vector<Backup>, Error>::ok(std::move(backups));
}

Result<ResolutionEntry, Error> BackupRepository::log_resolution(ResolutionEntry entry) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO resolution_log (map_id, vault_id, winner, backup_ref, resolved_at)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<ResolutionEntry>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, entry.map_id);
    stmt.bind_text(2, entry.vault_id);
    stmt.bind_text(3, winner_name(entry.winner));
    stmt.bind_optional_text(4, entry.backup_ref);
    stmt.bind_timestamp(5, entry.resolved_at);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<ResolutionEntry>(step_result);
    }
    entry.id = sqlite3_last_insert_rowid(db_.handle());
    return Result<ResolutionEntry, Error>::ok(std::move(entry));
}

Result<std::vector<ResolutionEntry>, Error> BackupRepository::resolutions(const std::string& map_id) {
    std::vector<ResolutionEntry> entries;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, map_id, vault_id, winner, backup_ref, resolved_at
        FROM resolution_log
        WHERE ?1 = '' OR map_id = ?1
        ORDER BY resolved_at DESC, id DESC;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::vector<ResolutionEntry>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<ResolutionEntry>>(step_result);
        }
        if (!step_result.unwrap()) break;

        entries.push_back(ResolutionEntry{
            .id = stmt.column_int64(0),
            .map_id = stmt.column_text(1),
            .vault_id = stmt.column_text(2),
            .winner = stmt.column_text(3) == "local" ? Winner::Local : Winner::Remote,
            .backup_ref = stmt.column_optional_text(4),
            .resolved_at = stmt.column_timestamp(5)
        });
    }
    return Result<std::vector<ResolutionEntry>, Error>::ok(std::move(entries));
}

} // namespace mindsync::storage
