#include "storage/vault_repository.hpp"

namespace mindsync::storage {

namespace {

constexpr const char* VAULT_COLUMNS = R"SQL(
    SELECT v.id, v.name, v.remote_location, v.last_opened, v.last_full_sync,
           v.remote_timestamp,
           (SELECT COUNT(*) FROM maps m WHERE m.vault_id = v.id)
    FROM vaults v
)SQL";

} // namespace

Vault VaultRepository::row_to_vault(Statement& stmt) {
    return Vault{
        .id = stmt.column_text(0),
        .name = stmt.column_text(1),
        .remote_location = stmt.column_text(2),
        .last_opened = stmt.column_optional_timestamp(3),
        .last_full_sync = stmt.column_optional_timestamp(4),
        .remote_timestamp = stmt.column_timestamp(5),
        .map_count = stmt.column_int(6)
    };
}

Result<void, Error> VaultRepository::run(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<void>(step_result);
    }
    return Result<void, Error>::ok();
}

Result<std::optional<Vault>, Error> VaultRepository::get(const std::string& id) {
    auto stmt_result = db_.prepare(std::string(VAULT_COLUMNS) + " WHERE v.id = ?;");
    if (stmt_result.is_err()) {
        return propagate<std::optional<Vault>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<Vault>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Vault>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Vault>, Error>::ok(row_to_vault(stmt));
}

Result<std::vector<Vault>, Error> VaultRepository::list() {
    std::vector<Vault> vaults;

    auto stmt_result = db_.prepare(std::string(VAULT_COLUMNS) + " ORDER BY v.name, v.id;");
    if (stmt_result.is_err()) {
        return propagate<std::vector<Vault>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<Vault>>(step_result);
        }
        if (!step_result.unwrap()) break;
        vaults.push_back(row_to_vault(stmt));
    }
    return Result<std::vector<Vault>, Error>::ok(std::move(vaults));
}

Result<void, Error> VaultRepository::save(const Vault& vault) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO vaults (id, name, remote_location, last_opened, last_full_sync, remote_timestamp)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            remote_location = excluded.remote_location,
            last_opened = excluded.last_opened,
            last_full_sync = excluded.last_full_sync,
            remote_timestamp = excluded.remote_timestamp;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault.id);
    stmt.bind_text(2, vault.name);
    stmt.bind_text(3, vault.remote_location);
    stmt.bind_optional_timestamp(4, vault.last_opened);
    stmt.bind_optional_timestamp(5, vault.last_full_sync);
    stmt.bind_timestamp(6, vault.remote_timestamp);
    return run(stmt);
}

Result<void, Error> VaultRepository::remove(const std::string& id) {
    auto stmt_result = db_.prepare("DELETE FROM vaults WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id);
    return run(stmt);
}

Result<void, Error> VaultRepository::set_last_opened(const std::string& id, Timestamp at) {
    auto stmt_result = db_.prepare("UPDATE vaults SET last_opened = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, at);
    stmt.bind_text(2, id);
    return run(stmt);
}

Result<void, Error> VaultRepository::set_sync_state(
    const std::string& id,
    Timestamp remote_timestamp,
    std::optional<Timestamp> full_sync_at
) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE vaults SET remote_timestamp = ?, last_full_sync = ? WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, remote_timestamp);
    stmt.bind_optional_timestamp(2, full_sync_at);
    stmt.bind_text(3, id);
    return run(stmt);
}

Result<void, Error> VaultRepository::set_remote_timestamp(const std::string& id, Timestamp remote_timestamp) {
    auto stmt_result = db_.prepare("UPDATE vaults SET remote_timestamp = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, remote_timestamp);
    stmt.bind_text(2, id);
    return run(stmt);
}

Result<void, Error> VaultRepository::clear_full_sync(const std::string& id) {
    auto stmt_result = db_.prepare("UPDATE vaults SET last_full_sync = NULL WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id);
    return run(stmt);
}

} // namespace mindsync::storage
