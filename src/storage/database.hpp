#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mindsync::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_optional_text(int index, const std::optional<std::string>& text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_timestamp(int index, Timestamp ts);
    Result<void, Error> bind_optional_timestamp(int index, const std::optional<Timestamp>& ts);
    Result<void, Error> bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] Timestamp column_timestamp(int index) const;
    [[nodiscard]] std::optional<Timestamp> column_optional_timestamp(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Returns true if there's a row
    [[nodiscard]] Result<bool, Error> step();
    [[nodiscard]] Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * Opened in serialized threading mode with WAL journaling; callers still
 * serialize transactions themselves (see LocalStore's mutex) because a
 * transaction is per connection, not per thread.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits when f() returns ok, rolls back otherwise.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            log_rollback_failure(rollback());
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            log_rollback_failure(rollback());
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    static void log_rollback_failure(const Result<void, Error>& rollback_result);

    sqlite3* db_ = nullptr;
};

/**
 * Map a SQLite result code to a LocalStorage error; disk-full and
 * out-of-memory get an explicit "storage exhausted" message.
 */
[[nodiscard]] Error storage_error(int rc, const std::string& context);

} // namespace mindsync::storage
