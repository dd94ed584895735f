#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace mindsync::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            -- Vault metadata stays resident for every vault
            CREATE TABLE IF NOT EXISTS vaults (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                remote_location TEXT NOT NULL DEFAULT '',
                last_opened INTEGER,
                last_full_sync INTEGER,
                remote_timestamp INTEGER NOT NULL DEFAULT 0,
                map_count INTEGER NOT NULL DEFAULT 0
            );

            -- One row per map; the timestamp pair is the resumable sync state
            CREATE TABLE IF NOT EXISTS maps (
                id TEXT PRIMARY KEY,
                vault_id TEXT NOT NULL REFERENCES vaults(id) ON DELETE CASCADE,
                title TEXT NOT NULL DEFAULT '',
                local_modified_at INTEGER NOT NULL,
                last_synced_at INTEGER NOT NULL DEFAULT 0,
                remote_revision TEXT NOT NULL DEFAULT '',
                sync_status TEXT NOT NULL DEFAULT 'pending'
            );
            CREATE INDEX IF NOT EXISTS idx_maps_vault ON maps(vault_id);

            -- Parent references are validated on read, not by foreign key,
            -- so a damaged tree surfaces as corruption instead of a write failure
            CREATE TABLE IF NOT EXISTS nodes (
                map_id TEXT NOT NULL REFERENCES maps(id) ON DELETE CASCADE,
                id TEXT NOT NULL,
                parent_id TEXT,
                title TEXT NOT NULL DEFAULT '',
                content TEXT NOT NULL DEFAULT '',
                sort_order INTEGER NOT NULL DEFAULT 0,
                modified_at INTEGER NOT NULL,
                PRIMARY KEY (map_id, id)
            );

            CREATE TABLE IF NOT EXISTS edges (
                map_id TEXT NOT NULL REFERENCES maps(id) ON DELETE CASCADE,
                id TEXT NOT NULL,
                source TEXT NOT NULL,
                target TEXT NOT NULL,
                kind TEXT NOT NULL DEFAULT 'hierarchy',
                label TEXT NOT NULL DEFAULT '',
                PRIMARY KEY (map_id, id)
            );

            -- At most one pending operation per map (coalescing)
            CREATE TABLE IF NOT EXISTS sync_queue (
                map_id TEXT PRIMARY KEY,
                seq INTEGER NOT NULL,
                vault_id TEXT NOT NULL,
                kind TEXT NOT NULL,
                enqueued_at INTEGER NOT NULL,
                payload TEXT,
                base_revision TEXT NOT NULL DEFAULT '',
                attempts INTEGER NOT NULL DEFAULT 0,
                next_attempt_at INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_sync_queue_due ON sync_queue(next_attempt_at, seq);

            CREATE TABLE IF NOT EXISTS counters (
                name TEXT PRIMARY KEY,
                value INTEGER NOT NULL
            );

            CREATE TABLE IF NOT EXISTS vault_locks (
                vault_id TEXT PRIMARY KEY,
                lock_id TEXT NOT NULL,
                acquired_at INTEGER NOT NULL,
                expires_at INTEGER NOT NULL,
                operation TEXT NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS vault_locks;
            DROP TABLE IF EXISTS counters;
            DROP TABLE IF EXISTS sync_queue;
            DROP TABLE IF EXISTS edges;
            DROP TABLE IF EXISTS nodes;
            DROP TABLE IF EXISTS maps;
            DROP TABLE IF EXISTS vaults;
        )SQL"
    },
    {
        .version = 2,
        .name = "conflict_backups",
        .up_sql = R"SQL(
            -- Backups outlive the map they were taken from
            CREATE TABLE IF NOT EXISTS backups (
                backup_ref TEXT PRIMARY KEY,
                map_id TEXT NOT NULL,
                vault_id TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                payload TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_backups_map ON backups(map_id);

            CREATE TABLE IF NOT EXISTS resolution_log (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                map_id TEXT NOT NULL,
                vault_id TEXT NOT NULL,
                winner TEXT NOT NULL,
                backup_ref TEXT,
                resolved_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_resolution_log_map ON resolution_log(map_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS resolution_log;
            DROP TABLE IF EXISTS backups;
        )SQL"
    },
    {
        .version = 3,
        .name = "map_sync_error",
        .up_sql = R"SQL(
            ALTER TABLE maps ADD COLUMN sync_error TEXT;
        )SQL",
        .down_sql = R"SQL(
            ALTER TABLE maps DROP COLUMN sync_error;
        )SQL"
    },
    {
        .version = 4,
        .name = "lock_holder",
        .up_sql = R"SQL(
            ALTER TABLE vault_locks ADD COLUMN device_id TEXT NOT NULL DEFAULT '';

            -- Single row naming this installation
            CREATE TABLE IF NOT EXISTS device_identity (
                id TEXT NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS device_identity;
            ALTER TABLE vault_locks DROP COLUMN device_id;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Bring the schema up to the latest version. Each call runs in one
     * transaction; a failing step leaves the previous version in place.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    // Undo migrations above target_version, newest first.
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> apply(const Migration& m);
    [[nodiscard]] Result<void, Error> revert(const Migration& m);
    [[nodiscard]] Result<void, Error> record_version(const Migration& m);
    [[nodiscard]] Result<void, Error> forget_version(int version);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace mindsync::storage
