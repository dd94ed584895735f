#pragma once

#include <QString>
#include <chrono>

class QSettings;

namespace mindsync::sync {

using namespace std::chrono_literals;

/**
 * SyncConfig - Tunables of the worker, the lock manager and the switcher.
 */
struct SyncConfig {
    int batch_size{20};
    std::chrono::milliseconds sync_interval{5min};
    std::chrono::milliseconds backoff_base{1s};
    std::chrono::milliseconds backoff_cap{60s};
    std::chrono::milliseconds lock_lease{2min};
    bool evict_on_switch{true};
};

/**
 * Read the "sync/" group of `settings`, then apply environment overrides:
 * MINDSYNC_BATCH_SIZE, MINDSYNC_SYNC_INTERVAL_MS, MINDSYNC_BACKOFF_BASE_MS,
 * MINDSYNC_BACKOFF_CAP_MS, MINDSYNC_LOCK_LEASE_MS, MINDSYNC_EVICT_ON_SWITCH.
 * Missing or invalid values keep their defaults.
 */
[[nodiscard]] SyncConfig load_sync_config(QSettings& settings);

/**
 * Database location: MINDSYNC_DB_PATH, else "storage/databasePath" in
 * settings, else mindsync.db in the application data directory.
 */
[[nodiscard]] QString resolve_database_path(QSettings& settings);

/**
 * Root directory of the folder backend: MINDSYNC_REMOTE_DIR, else
 * "remote/folder" in settings, else remote/ in the application data
 * directory.
 */
[[nodiscard]] QString resolve_remote_root(QSettings& settings);

/**
 * Enable debug output of the mindsync.* categories when
 * MINDSYNC_DEBUG_SYNC is set.
 */
void apply_debug_logging();

} // namespace mindsync::sync
