#include "storage/lock_repository.hpp"

namespace mindsync::storage {

Result<std::optional<Lock>, Error> LockRepository::get(const std::string& vault_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT lock_id, vault_id, acquired_at, expires_at, operation, device_id
        FROM vault_locks WHERE vault_id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::optional<Lock>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<Lock>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Lock>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<Lock>, Error>::ok(Lock{
        .lock_id = stmt.column_text(0),
        .vault_id = stmt.column_text(1),
        .acquired_at = stmt.column_timestamp(2),
        .expires_at = stmt.column_timestamp(3),
        .operation = stmt.column_text(4),
        .device_id = stmt.column_text(5)
    });
}

Result<bool, Error> LockRepository::insert_if_free(const Lock& candidate, Timestamp now) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO vault_locks (vault_id, lock_id, acquired_at, expires_at, operation, device_id)
        VALUES (?1, ?2, ?3, ?4, ?5, ?7)
        ON CONFLICT(vault_id) DO UPDATE SET
            lock_id = excluded.lock_id,
            acquired_at = excluded.acquired_at,
            expires_at = excluded.expires_at,
            operation = excluded.operation,
            device_id = excluded.device_id
        WHERE vault_locks.expires_at < ?6;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<bool>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, candidate.vault_id);
    stmt.bind_text(2, candidate.lock_id);
    stmt.bind_timestamp(3, candidate.acquired_at);
    stmt.bind_timestamp(4, candidate.expires_at);
    stmt.bind_text(5, candidate.operation);
    stmt.bind_timestamp(6, now);
    stmt.bind_text(7, candidate.device_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<bool>(step_result);
    }
    return Result<bool, Error>::ok(db_.changes() > 0);
}

Result<bool, Error> LockRepository::remove(const std::string& vault_id, const std::string& lock_id) {
    auto stmt_result = db_.prepare("DELETE FROM vault_locks WHERE vault_id = ? AND lock_id = ?;");
    if (stmt_result.is_err()) {
        return propagate<bool>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);
    stmt.bind_text(2, lock_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<bool>(step_result);
    }
    return Result<bool, Error>::ok(db_.changes() > 0);
}

Result<std::string, Error> LockRepository::device_id() {
    auto select = db_.prepare("SELECT id FROM device_identity LIMIT 1;");
    if (select.is_err()) {
        return propagate<std::string>(select);
    }
    auto query = std::move(select).unwrap();
    auto row = query.step();
    if (row.is_err()) {
        return propagate<std::string>(row);
    }
    if (row.unwrap()) {
        return Result<std::string, Error>::ok(query.column_text(0));
    }

    auto insert = db_.prepare("INSERT INTO device_identity (id) VALUES (?);");
    if (insert.is_err()) {
        return propagate<std::string>(insert);
    }
    auto stmt = std::move(insert).unwrap();
    const auto id = new_id();
    stmt.bind_text(1, id);
    auto done = stmt.step();
    if (done.is_err()) {
        return propagate<std::string>(done);
    }
    return Result<std::string, Error>::ok(id);
}

} // namespace mindsync::storage
