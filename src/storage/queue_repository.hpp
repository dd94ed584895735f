#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mindsync::storage {

/**
 * QueueRepository - The persisted operation queue (table sync_queue).
 *
 * Holds at most one row per map. Every enqueue takes a fresh seq from the
 * counters table, so a row's seq identifies the exact version of the
 * pending work; complete() only removes the version the worker pushed.
 */
class QueueRepository {
public:
    explicit QueueRepository(Database& db) : db_(db) {}

    /**
     * Insert or coalesce an operation. Returns the stored operation with
     * its assigned seq. Must run inside the caller's transaction.
     */
    [[nodiscard]] Result<SyncOperation, Error> enqueue(SyncOperation op);

    [[nodiscard]] Result<std::optional<SyncOperation>, Error> get(const std::string& map_id);

    /**
     * Operations with next_attempt_at <= now, oldest seq first.
     */
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> due(Timestamp now, int limit);

    [[nodiscard]] Result<bool, Error> complete(const std::string& map_id, int64_t seq);

    [[nodiscard]] Result<void, Error> reschedule(
        const std::string& map_id,
        int64_t seq,
        int attempts,
        Timestamp next_attempt_at);

    /**
     * Make every operation immediately due (network reconnect).
     */
    [[nodiscard]] Result<void, Error> reset_backoff();

    [[nodiscard]] Result<void, Error> set_base_revision(const std::string& map_id,
                                                        const std::string& revision);

    [[nodiscard]] Result<void, Error> remove(const std::string& map_id);
    [[nodiscard]] Result<void, Error> remove_by_vault(const std::string& vault_id);

    [[nodiscard]] Result<int, Error> count();
    [[nodiscard]] Result<std::optional<Timestamp>, Error> next_attempt_time();

private:
    Database& db_;

    [[nodiscard]] Result<int64_t, Error> next_seq();
    [[nodiscard]] Result<SyncOperation, Error> row_to_operation(Statement& stmt);
    [[nodiscard]] Result<void, Error> run(Statement& stmt);
};

} // namespace mindsync::storage
