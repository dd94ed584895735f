#pragma once

#include "sync/conflict_resolver.hpp"
#include "sync/events.hpp"
#include "sync/sync_config.hpp"
#include "remote/remote_adapter.hpp"
#include "storage/local_store.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace mindsync::sync {

/**
 * SyncWorker - Drains the operation queue against the remote backend.
 *
 * One run_cycle() processes every due operation, batch_size at a time,
 * listing each vault once per batch. Operations for one map are applied
 * in queue order; a failing map is rescheduled with exponential backoff
 * without holding back the others. Errors never escape to the caller of
 * the local store: they end up as per-map status and retries.
 *
 * Not thread-safe: run it from a single thread (the service's sync
 * thread). request_stop() may be called from any thread.
 */
class SyncWorker {
public:
    SyncWorker(storage::LocalStore& store,
               remote::RemoteAdapter& remote,
               ConflictResolver& resolver,
               EventSink& events,
               SyncConfig config);

    /**
     * Process all operations due now. The report counts operations, not
     * maps; a map pushed twice in one cycle counts twice.
     */
    [[nodiscard]] SyncReport run_cycle();

    void request_stop() { stop_requested_.store(true); }
    void clear_stop() { stop_requested_.store(false); }

    [[nodiscard]] std::optional<Timestamp> last_sync_time() const { return last_sync_time_; }

    // Called with the vault id when a map of that vault is found corrupt
    // in the local store.
    std::function<void(const std::string&)> on_corruption;

private:
    using Listing = std::map<std::string, remote::RemoteFileInfo>;

    storage::LocalStore& store_;
    remote::RemoteAdapter& remote_;
    ConflictResolver& resolver_;
    EventSink& events_;
    SyncConfig config_;

    std::atomic<bool> stop_requested_{false};
    std::optional<Timestamp> last_sync_time_;
    std::map<std::string, std::optional<Listing>> listings_;
    std::set<std::string> pushed_vaults_;  // vaults written to this cycle

    [[nodiscard]] Result<Listing*, Error> listing_for(const std::string& vault_id);

    /**
     * After our own writes, record the backend timestamp as seen when the
     * backend still matches every local revision, so the next open does
     * not merge our own changes back.
     */
    [[nodiscard]] Result<void, Error> advance_watermark(const std::string& vault_id);

    void process(const SyncOperation& op, SyncReport& report);
    void process_upsert(const SyncOperation& op, SyncReport& report);
    void process_delete(const SyncOperation& op, SyncReport& report);
    void apply_resolution(const SyncOperation& op, const Result<Resolution, Error>& resolution,
                          SyncReport& report);

    void fail(const SyncOperation& op, const Error& error, SyncReport& report);
    void reschedule(const SyncOperation& op, int attempts, std::chrono::milliseconds delay);
    void set_status(const std::string& map_id, SyncStatus status,
                    const std::optional<std::string>& error = std::nullopt);
};

} // namespace mindsync::sync
