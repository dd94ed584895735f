#include "storage/migrations.hpp"
#include "core/log.hpp"

namespace mindsync::storage {

namespace {

constexpr const char* VERSION_TABLE_SQL = R"SQL(
    CREATE TABLE IF NOT EXISTS schema_migrations (
        version INTEGER PRIMARY KEY,
        name TEXT NOT NULL,
        applied_at INTEGER NOT NULL
    );
)SQL";

Error step_failed(const char* verb, const Migration& m, const Error& cause) {
    return Error{ErrorKind::LocalStorage,
                 std::string(verb) + " migration " + std::to_string(m.version) + " (" + m.name +
                     "): " + cause.message};
}

} // namespace

Result<int, Error> MigrationRunner::current_version() {
    auto created = db_.execute(VERSION_TABLE_SQL);
    if (created.is_err()) return propagate<int>(created);

    auto stmt = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt.is_err()) return propagate<int>(stmt);

    auto query = std::move(stmt).unwrap();
    auto row = query.step();
    if (row.is_err()) return propagate<int>(row);
    return Result<int, Error>::ok(row.unwrap() ? query.column_int(0) : 0);
}

Result<void, Error> MigrationRunner::record_version(const Migration& m) {
    auto stmt = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt.is_err()) return propagate<void>(stmt);

    auto insert = std::move(stmt).unwrap();
    insert.bind_int(1, m.version);
    insert.bind_text(2, m.name);
    insert.bind_timestamp(3, Timestamp::now());
    auto done = insert.step();
    if (done.is_err()) return propagate<void>(done);
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::forget_version(int version) {
    auto stmt = db_.prepare("DELETE FROM schema_migrations WHERE version = ?;");
    if (stmt.is_err()) return propagate<void>(stmt);

    auto remove = std::move(stmt).unwrap();
    remove.bind_int(1, version);
    auto done = remove.step();
    if (done.is_err()) return propagate<void>(done);
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto run = db_.execute(m.up_sql);
    if (run.is_err()) {
        return Result<void, Error>::err(step_failed("Cannot apply", m, run.unwrap_err()));
    }
    qCInfo(mindsyncStoreLog) << "Schema migrated to version" << m.version << qs(m.name);
    return record_version(m);
}

Result<void, Error> MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::InvalidArgument,
            "Migration " + std::to_string(m.version) + " cannot be reverted"});
    }
    auto run = db_.execute(m.down_sql);
    if (run.is_err()) {
        return Result<void, Error>::err(step_failed("Cannot revert", m, run.unwrap_err()));
    }
    qCInfo(mindsyncStoreLog) << "Schema reverted below version" << m.version;
    return forget_version(m.version);
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) return propagate<void>(version);
    const int from = version.unwrap();
    if (from >= target_version) return Result<void, Error>::ok();

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= from || m.version > target_version) continue;
            auto step = apply(m);
            if (step.is_err()) return step;
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) return propagate<void>(version);
    const int from = version.unwrap();
    if (from <= target_version) return Result<void, Error>::ok();

    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version > from || it->version <= target_version) continue;
            auto step = revert(*it);
            if (step.is_err()) return step;
        }
        return Result<void, Error>::ok();
    });
}

} // namespace mindsync::storage
