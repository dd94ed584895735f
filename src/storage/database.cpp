#include "storage/database.hpp"
#include "core/log.hpp"

namespace mindsync::storage {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

Result<void, Error> bind_result(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error(rc, what));
    }
    return Result<void, Error>::ok();
}

} // namespace

Error storage_error(int rc, const std::string& context) {
    int primary = rc & 0xFF;
    if (primary == SQLITE_FULL || primary == SQLITE_NOMEM) {
        return Error{ErrorKind::LocalStorage, context + ": storage exhausted", rc};
    }
    if (primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) {
        return Error{ErrorKind::Corruption, context + ": " + sqlite3_errstr(rc), rc};
    }
    return Error{ErrorKind::LocalStorage, context + ": " + sqlite3_errstr(rc), rc};
}

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return bind_result(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "Failed to bind text");
}

Result<void, Error> Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return bind_result(sqlite3_bind_int(stmt_.get(), index, value), "Failed to bind int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return bind_result(sqlite3_bind_int64(stmt_.get(), index, value), "Failed to bind int64");
}

Result<void, Error> Statement::bind_timestamp(int index, Timestamp ts) {
    return bind_int64(index, ts.millis());
}

Result<void, Error> Statement::bind_optional_timestamp(int index, const std::optional<Timestamp>& ts) {
    return ts ? bind_timestamp(index, *ts) : bind_null(index);
}

Result<void, Error> Statement::bind_null(int index) {
    return bind_result(sqlite3_bind_null(stmt_.get(), index), "Failed to bind null");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return {reinterpret_cast<const char*>(text),
            static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index))};
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

Timestamp Statement::column_timestamp(int index) const {
    return Timestamp(column_int64(index));
}

std::optional<Timestamp> Statement::column_optional_timestamp(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_timestamp(index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::err(storage_error(rc, "Step failed"));
}

Result<void, Error> Statement::reset() {
    return bind_result(sqlite3_reset(stmt_.get()), "Reset failed");
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error{ErrorKind::LocalStorage, error, rc});
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, BUSY_TIMEOUT_MS);

    auto fk = db.execute("PRAGMA foreign_keys = ON;");
    if (fk.is_err()) {
        return Result<Database, Error>::err(fk.unwrap_err());
    }

    // In-memory databases silently stay in "memory" journal mode.
    if (path != ":memory:") {
        auto wal = db.execute("PRAGMA journal_mode = WAL;");
        if (wal.is_err()) {
            qCWarning(mindsyncStoreLog) << "WAL unavailable for" << qs(path)
                                        << qs(wal.unwrap_err().message);
        }
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{ErrorKind::LocalStorage, last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(storage_error(rc, error));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

void Database::log_rollback_failure(const Result<void, Error>& rollback_result) {
    rollback_result.inspect_err([](const Error& e) {
        qCWarning(mindsyncStoreLog) << "Rollback failed:" << qs(e.message);
    });
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace mindsync::storage
