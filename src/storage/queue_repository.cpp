#include "storage/queue_repository.hpp"
#include "storage/map_codec.hpp"

namespace mindsync::storage {

namespace {

constexpr const char* OPERATION_COLUMNS = R"SQL(
    SELECT seq, kind, vault_id, map_id, enqueued_at, payload, base_revision,
           attempts, next_attempt_at
    FROM sync_queue
)SQL";

constexpr const char* SEQ_COUNTER = "sync_queue.seq";

} // namespace

Result<void, Error> QueueRepository::run(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<void>(step_result);
    }
    return Result<void, Error>::ok();
}

Result<SyncOperation, Error> QueueRepository::row_to_operation(Statement& stmt) {
    auto kind = operation_kind_from_name(stmt.column_text(1));
    if (!kind) {
        return Result<SyncOperation, Error>::err(Error{ErrorKind::Corruption,
            "Unknown queued operation kind '" + stmt.column_text(1) + "'"});
    }

    SyncOperation op{
        .seq = stmt.column_int64(0),
        .kind = *kind,
        .vault_id = stmt.column_text(2),
        .map_id = stmt.column_text(3),
        .enqueued_at = stmt.column_timestamp(4),
        .payload = std::nullopt,
        .base_revision = stmt.column_text(6),
        .attempts = stmt.column_int(7),
        .next_attempt_at = stmt.column_timestamp(8)
    };

    if (auto payload = stmt.column_optional_text(5)) {
        auto decoded = decode_map(*payload);
        if (decoded.is_err()) {
            return propagate<SyncOperation>(decoded);
        }
        op.payload = std::move(decoded).unwrap();
    }
    return Result<SyncOperation, Error>::ok(std::move(op));
}

Result<int64_t, Error> QueueRepository::next_seq() {
    auto bump_result = db_.prepare(R"SQL(
        INSERT INTO counters (name, value) VALUES (?, 1)
        ON CONFLICT(name) DO UPDATE SET value = value + 1;
    )SQL");
    if (bump_result.is_err()) {
        return propagate<int64_t>(bump_result);
    }
    auto bump = std::move(bump_result).unwrap();
    bump.bind_text(1, SEQ_COUNTER);
    auto bumped = run(bump);
    if (bumped.is_err()) {
        return propagate<int64_t>(bumped);
    }

    auto read_result = db_.prepare("SELECT value FROM counters WHERE name = ?;");
    if (read_result.is_err()) {
        return propagate<int64_t>(read_result);
    }
    auto read = std::move(read_result).unwrap();
    read.bind_text(1, SEQ_COUNTER);
    auto step_result = read.step();
    if (step_result.is_err()) {
        return propagate<int64_t>(step_result);
    }
    return Result<int64_t, Error>::ok(read.column_int64(0));
}

Result<SyncOperation, Error> QueueRepository::enqueue(SyncOperation op) {
    auto pending_result = get(op.map_id);
    if (pending_result.is_err()) {
        return propagate<SyncOperation>(pending_result);
    }
    if (const auto& pending = pending_result.unwrap()) {
        op = coalesce(*pending, std::move(op));
    }

    auto seq_result = next_seq();
    if (seq_result.is_err()) {
        return propagate<SyncOperation>(seq_result);
    }
    op.seq = seq_result.unwrap();

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO sync_queue (map_id, seq, vault_id, kind, enqueued_at, payload,
                                base_revision, attempts, next_attempt_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(map_id) DO UPDATE SET
            seq = excluded.seq,
            vault_id = excluded.vault_id,
            kind = excluded.kind,
            enqueued_at = excluded.enqueued_at,
            payload = excluded.payload,
            base_revision = excluded.base_revision,
            attempts = excluded.attempts,
            next_attempt_at = excluded.next_attempt_at;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<SyncOperation>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, op.map_id);
    stmt.bind_int64(2, op.seq);
    stmt.bind_text(3, op.vault_id);
    stmt.bind_text(4, operation_kind_name(op.kind));
    stmt.bind_timestamp(5, op.enqueued_at);
    if (op.payload) {
        stmt.bind_text(6, encode_map(*op.payload));
    } else {
        stmt.bind_null(6);
    }
    stmt.bind_text(7, op.base_revision);
    stmt.bind_int(8, op.attempts);
    stmt.bind_timestamp(9, op.next_attempt_at);

    auto inserted = run(stmt);
    if (inserted.is_err()) {
        return propagate<SyncOperation>(inserted);
    }
    return Result<SyncOperation, Error>::ok(std::move(op));
}

Result<std::optional<SyncOperation>, Error> QueueRepository::get(const std::string& map_id) {
    auto stmt_result = db_.prepare(std::string(OPERATION_COLUMNS) + " WHERE map_id = ?;");
    if (stmt_result.is_err()) {
        return propagate<std::optional<SyncOperation>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<SyncOperation>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<SyncOperation>, Error>::ok(std::nullopt);
    }

    auto op = row_to_operation(stmt);
    if (op.is_err()) {
        return propagate<std::optional<SyncOperation>>(op);
    }
    return Result<std::optional<SyncOperation>, Error>::ok(std::move(op).unwrap());
}

Result<std::vector<SyncOperation>, Error> QueueRepository::due(Timestamp now, int limit) {
    std::vector<SyncOperation> ops;

    auto stmt_result = db_.prepare(std::string(OPERATION_COLUMNS) +
        " WHERE next_attempt_at <= ? ORDER BY seq LIMIT ?;");
    if (stmt_result.is_err()) {
        return propagate<std::vector<SyncOperation>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, now);
    stmt.bind_int(2, limit);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<SyncOperation>>(step_result);
        }
        if (!step_result.unwrap()) break;

        auto op = row_to_operation(stmt);
        if (op.is_err()) {
            return propagate<std::vector<SyncOperation>>(op);
        }
        ops.push_back(std::move(op).unwrap());
    }
    return Result<std::vector<SyncOperation>, Error>::ok(std::move(ops));
}

Result<bool, Error> QueueRepository::complete(const std::string& map_id, int64_t seq) {
    auto stmt_result = db_.prepare("DELETE FROM sync_queue WHERE map_id = ? AND seq = ?;");
    if (stmt_result.is_err()) {
        return propagate<bool>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    stmt.bind_int64(2, seq);
    auto removed = run(stmt);
    if (removed.is_err()) {
        return propagate<bool>(removed);
    }
    return Result<bool, Error>::ok(db_.changes() > 0);
}

Result<void, Error> QueueRepository::reschedule(
    const std::string& map_id,
    int64_t seq,
    int attempts,
    Timestamp next_attempt_at
) {
    // A version coalesced in during the attempt inherits the schedule.
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE sync_queue SET attempts = ?, next_attempt_at = ?
        WHERE map_id = ? AND seq >= ?;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, attempts);
    stmt.bind_timestamp(2, next_attempt_at);
    stmt.bind_text(3, map_id);
    stmt.bind_int64(4, seq);
    return run(stmt);
}

Result<void, Error> QueueRepository::reset_backoff() {
    return db_.execute("UPDATE sync_queue SET next_attempt_at = 0;");
}

Result<void, Error> QueueRepository::set_base_revision(const std::string& map_id,
                                                       const std::string& revision) {
    auto stmt_result = db_.prepare("UPDATE sync_queue SET base_revision = ? WHERE map_id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, revision);
    stmt.bind_text(2, map_id);
    return run(stmt);
}

Result<void, Error> QueueRepository::remove(const std::string& map_id) {
    auto stmt_result = db_.prepare("DELETE FROM sync_queue WHERE map_id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    return run(stmt);
}

Result<void, Error> QueueRepository::remove_by_vault(const std::string& vault_id) {
    auto stmt_result = db_.prepare("DELETE FROM sync_queue WHERE vault_id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);
    return run(stmt);
}

Result<int, Error> QueueRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM sync_queue;");
    if (stmt_result.is_err()) {
        return propagate<int>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<int>(step_result);
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<std::optional<Timestamp>, Error> QueueRepository::next_attempt_time() {
    auto stmt_result = db_.prepare("SELECT MIN(next_attempt_at) FROM sync_queue;");
    if (stmt_result.is_err()) {
        return propagate<std::optional<Timestamp>>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<Timestamp>>(step_result);
    }
    return Result<std::optional<Timestamp>, Error>::ok(stmt.column_optional_timestamp(0));
}

} // namespace mindsync::storage
