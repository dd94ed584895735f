#include <catch2/catch_test_macros.hpp>
#include "storage/backup_repository.hpp"
#include "storage/database.hpp"
#include "storage/lock_repository.hpp"
#include "storage/map_repository.hpp"
#include "storage/migrations.hpp"
#include "storage/queue_repository.hpp"
#include "storage/vault_repository.hpp"

using namespace mindsync;
using namespace mindsync::storage;

namespace {

Database migrated_db() {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    return db;
}

Vault make_vault(const std::string& id, const std::string& name) {
    return Vault{
        .id = id,
        .name = name,
        .remote_location = {},
        .last_opened = std::nullopt,
        .last_full_sync = std::nullopt,
        .remote_timestamp = Timestamp{},
        .map_count = 0
    };
}

Map make_map(const std::string& id, const std::string& vault_id, Timestamp modified) {
    auto map = create_map(id, vault_id, "Map " + id, modified);
    map.nodes.push_back(create_node(id + "-root", "Root"));
    map.nodes.push_back(create_node(id + "-child", "Child", id + "-root"));
    return map;
}

SyncOperation update_of(const Map& map, Timestamp at) {
    return SyncOperation{
        .seq = 0,
        .kind = map.remote_revision.empty() ? OperationKind::Create : OperationKind::Update,
        .vault_id = map.vault_id,
        .map_id = map.id,
        .enqueued_at = at,
        .payload = map,
        .base_revision = map.remote_revision,
        .attempts = 0,
        .next_attempt_at = at
    };
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db = Database::open_memory().unwrap();

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_text(1) == "Bob");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            REQUIRE(db.execute("INSERT INTO test VALUES (2);").is_ok());
            return Result<void, Error>::err(Error{"forced error"});
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }

    SECTION("Invalid SQL is a local storage error") {
        auto result = db.execute("SELEKT nothing;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::LocalStorage));
    }
}

TEST_CASE("storage_error classifies SQLite codes", "[storage]") {
    REQUIRE(storage_error(SQLITE_FULL, "write").is(ErrorKind::LocalStorage));
    REQUIRE(storage_error(SQLITE_FULL, "write").message.find("storage exhausted") != std::string::npos);
    REQUIRE(storage_error(SQLITE_CORRUPT, "read").is(ErrorKind::Corruption));
    REQUIRE(storage_error(SQLITE_NOTADB, "open").is(ErrorKind::Corruption));
    REQUIRE(storage_error(SQLITE_BUSY, "lock").is(ErrorKind::LocalStorage));
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());

    SECTION("Migrating twice is a no-op") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback removes the backup tables") {
        REQUIRE(runner.rollback_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT * FROM backups;").is_err());
        REQUIRE(db.execute("SELECT * FROM maps;").is_ok());
    }
}

TEST_CASE("VaultRepository", "[storage]") {
    auto db = migrated_db();
    VaultRepository vaults(db);

    REQUIRE(vaults.save(make_vault("v2", "Work")).is_ok());
    REQUIRE(vaults.save(make_vault("v1", "Home")).is_ok());

    SECTION("list is ordered by name") {
        auto list = vaults.list().unwrap();
        REQUIRE(list.size() == 2);
        REQUIRE(list[0].name == "Home");
        REQUIRE(list[1].name == "Work");
    }

    SECTION("a new vault is not cached") {
        auto vault = vaults.get("v1").unwrap();
        REQUIRE(vault);
        REQUIRE_FALSE(vault->is_cached());
        REQUIRE_FALSE(vault->last_opened);
    }

    SECTION("reconciliation marks the vault cached, clearing it uncaches") {
        REQUIRE(vaults.set_sync_state("v1", Timestamp(500), Timestamp(600)).is_ok());
        auto vault = *vaults.get("v1").unwrap();
        REQUIRE(vault.is_cached());
        REQUIRE(vault.remote_timestamp == Timestamp(500));
        REQUIRE(*vault.last_full_sync == Timestamp(600));

        REQUIRE(vaults.clear_full_sync("v1").is_ok());
        REQUIRE_FALSE(vaults.get("v1").unwrap()->is_cached());
    }

    SECTION("map_count follows the maps table") {
        MapRepository maps(db);
        REQUIRE(maps.save(make_map("m1", "v1", Timestamp(10)), SyncStatus::Pending).is_ok());
        REQUIRE(maps.save(make_map("m2", "v1", Timestamp(10)), SyncStatus::Pending).is_ok());
        REQUIRE(vaults.get("v1").unwrap()->map_count == 2);
        REQUIRE(vaults.get("v2").unwrap()->map_count == 0);
    }

    SECTION("removing a vault removes its maps") {
        MapRepository maps(db);
        REQUIRE(maps.save(make_map("m1", "v1", Timestamp(10)), SyncStatus::Pending).is_ok());
        REQUIRE(vaults.remove("v1").is_ok());
        REQUIRE_FALSE(vaults.get("v1").unwrap());
        REQUIRE_FALSE(maps.get("m1").unwrap());
    }
}

TEST_CASE("MapRepository", "[storage]") {
    auto db = migrated_db();
    REQUIRE(VaultRepository(db).save(make_vault("v1", "Home")).is_ok());
    MapRepository maps(db);

    auto map = make_map("m1", "v1", Timestamp(100));
    map.edges.push_back(Edge{.id = "e1", .source = "m1-child", .target = "m1-root",
                             .kind = EdgeKind::Reference, .label = "up"});
    REQUIRE(maps.save(map, SyncStatus::Pending).is_ok());

    SECTION("save and get keep every node and edge") {
        auto loaded = maps.get("m1").unwrap();
        REQUIRE(loaded);
        REQUIRE(same_content(*loaded, map));
        REQUIRE(loaded->local_modified_at == Timestamp(100));
        REQUIRE(loaded->is_dirty());
    }

    SECTION("save replaces nodes that were removed") {
        auto smaller = without_subtree(map, "m1-child");
        REQUIRE(maps.save(smaller, SyncStatus::Pending).is_ok());
        auto loaded = *maps.get("m1").unwrap();
        REQUIRE(loaded.nodes.size() == 1);
        REQUIRE(loaded.edges.empty());
    }

    SECTION("set_synced updates the bookkeeping") {
        REQUIRE(maps.set_synced("m1", Timestamp(100), "g1", SyncStatus::Clean).is_ok());
        auto state = *maps.sync_state("m1").unwrap();
        REQUIRE_FALSE(state.is_dirty());
        REQUIRE(state.remote_revision == "g1");
        REQUIRE(state.status == SyncStatus::Clean);
    }

    SECTION("set_status keeps the error text") {
        REQUIRE(maps.set_status("m1", SyncStatus::Pending, std::string("disk on fire")).is_ok());
        auto state = *maps.sync_state("m1").unwrap();
        REQUIRE(state.sync_error == "disk on fire");

        REQUIRE(maps.set_status("m1", SyncStatus::Clean, std::nullopt).is_ok());
        REQUIRE_FALSE(maps.sync_state("m1").unwrap()->sync_error);
    }

    SECTION("list_by_vault summarizes without loading nodes") {
        auto list = maps.list_by_vault("v1").unwrap();
        REQUIRE(list.size() == 1);
        REQUIRE(list[0].id == "m1");
        REQUIRE(list[0].node_count == 2);
    }

    SECTION("dirty_without_operation skips queued maps") {
        REQUIRE(maps.dirty_without_operation().unwrap() == std::vector<std::string>{"m1"});

        QueueRepository queue(db);
        REQUIRE(queue.enqueue(update_of(map, Timestamp(100))).is_ok());
        REQUIRE(maps.dirty_without_operation().unwrap().empty());
    }

    SECTION("remove_clean_by_vault keeps unsynced maps") {
        auto clean = make_map("m2", "v1", Timestamp(50));
        REQUIRE(maps.save(clean, SyncStatus::Clean).is_ok());
        REQUIRE(maps.set_synced("m2", Timestamp(50), "g2", SyncStatus::Clean).is_ok());

        REQUIRE(maps.remove_clean_by_vault("v1").unwrap() == 1);
        REQUIRE(maps.get("m1").unwrap());
        REQUIRE_FALSE(maps.get("m2").unwrap());
    }

    SECTION("a damaged tree loads as corruption") {
        REQUIRE(db.execute("UPDATE nodes SET parent_id = 'gone' WHERE id = 'm1-child';").is_ok());
        auto loaded = maps.get("m1");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.unwrap_err().is(ErrorKind::Corruption));
    }
}

TEST_CASE("MapRepository search", "[storage][search]") {
    auto db = migrated_db();
    REQUIRE(VaultRepository(db).save(make_vault("v1", "Home")).is_ok());
    REQUIRE(VaultRepository(db).save(make_vault("v2", "Work")).is_ok());
    MapRepository maps(db);

    auto garden = create_map("m1", "v1", "Garden plans", Timestamp(1));
    garden.nodes.push_back(create_node("n1", "Tomatoes"));
    garden.nodes.back().content = "Plant after the last frost";
    garden.nodes.push_back(create_node("n2", "Tools"));
    REQUIRE(maps.save(garden, SyncStatus::Pending).is_ok());

    auto other = create_map("m2", "v2", "Frost log", Timestamp(1));
    REQUIRE(maps.save(other, SyncStatus::Pending).is_ok());

    SECTION("matches node content case-insensitively within the vault") {
        auto results = maps.search("v1", "FROST").unwrap();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].map_id == "m1");
        REQUIRE(results[0].node_id == "n1");
        REQUIRE(results[0].snippet.find("frost") != std::string::npos);
    }

    SECTION("matches map titles without a node") {
        auto results = maps.search("v1", "garden").unwrap();
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].node_id);
        REQUIRE(results[0].map_title == "Garden plans");
    }

    SECTION("LIKE wildcards in the query are literal") {
        REQUIRE(maps.search("v1", "%").unwrap().empty());
        REQUIRE(maps.search("v1", "T_ols").unwrap().empty());
    }

    SECTION("empty query returns nothing") {
        REQUIRE(maps.search("v1", "").unwrap().empty());
    }
}

TEST_CASE("QueueRepository", "[storage][queue]") {
    auto db = migrated_db();
    REQUIRE(VaultRepository(db).save(make_vault("v1", "Home")).is_ok());
    QueueRepository queue(db);

    auto map = make_map("m1", "v1", Timestamp(10));

    SECTION("seq increases with every enqueue") {
        auto first = queue.enqueue(update_of(map, Timestamp(10))).unwrap();
        auto second = queue.enqueue(update_of(make_map("m2", "v1", Timestamp(11)), Timestamp(11))).unwrap();
        REQUIRE(second.seq > first.seq);
        REQUIRE(queue.count().unwrap() == 2);
    }

    SECTION("enqueueing the same map coalesces into one row") {
        auto first = queue.enqueue(update_of(map, Timestamp(10))).unwrap();
        REQUIRE(first.kind == OperationKind::Create);

        map.title = "Renamed";
        map.remote_revision = "g1";
        auto second = queue.enqueue(update_of(map, Timestamp(20))).unwrap();

        REQUIRE(queue.count().unwrap() == 1);
        REQUIRE(second.seq > first.seq);
        REQUIRE(second.kind == OperationKind::Create);

        auto stored = *queue.get("m1").unwrap();
        REQUIRE(stored.payload->title == "Renamed");
        REQUIRE(stored.base_revision.empty());
    }

    SECTION("complete only removes the matching version") {
        auto first = queue.enqueue(update_of(map, Timestamp(10))).unwrap();
        auto second = queue.enqueue(update_of(map, Timestamp(20))).unwrap();

        REQUIRE_FALSE(queue.complete("m1", first.seq).unwrap());
        REQUIRE(queue.count().unwrap() == 1);
        REQUIRE(queue.complete("m1", second.seq).unwrap());
        REQUIRE(queue.count().unwrap() == 0);
    }

    SECTION("due honours next_attempt_at and seq order") {
        auto a = queue.enqueue(update_of(map, Timestamp(10))).unwrap();
        auto b = queue.enqueue(update_of(make_map("m2", "v1", Timestamp(11)), Timestamp(11))).unwrap();
        REQUIRE(queue.reschedule("m1", a.seq, 1, Timestamp(1000)).is_ok());

        auto due = queue.due(Timestamp(500), 10).unwrap();
        REQUIRE(due.size() == 1);
        REQUIRE(due[0].map_id == "m2");
        REQUIRE(queue.next_attempt_time().unwrap() == Timestamp(11));

        due = queue.due(Timestamp(1000), 10).unwrap();
        REQUIRE(due.size() == 2);
        REQUIRE(due[0].seq == a.seq);
        REQUIRE(due[1].seq == b.seq);
        REQUIRE(due[0].attempts == 1);
    }

    SECTION("reset_backoff makes everything due") {
        auto a = queue.enqueue(update_of(map, Timestamp(10))).unwrap();
        REQUIRE(queue.reschedule("m1", a.seq, 4, Timestamp(99999)).is_ok());
        REQUIRE(queue.due(Timestamp(20), 10).unwrap().empty());

        REQUIRE(queue.reset_backoff().is_ok());
        REQUIRE(queue.due(Timestamp(20), 10).unwrap().size() == 1);
    }

    SECTION("delete operations carry no payload") {
        auto op = update_of(map, Timestamp(10));
        op.kind = OperationKind::Delete;
        op.payload = std::nullopt;
        REQUIRE(queue.enqueue(op).is_ok());

        auto stored = *queue.get("m1").unwrap();
        REQUIRE(stored.kind == OperationKind::Delete);
        REQUIRE_FALSE(stored.payload);
    }

    SECTION("a row with an unknown kind is corruption") {
        REQUIRE(queue.enqueue(update_of(map, Timestamp(10))).is_ok());
        REQUIRE(db.execute("UPDATE sync_queue SET kind = 'explode';").is_ok());
        auto stored = queue.get("m1");
        REQUIRE(stored.is_err());
        REQUIRE(stored.unwrap_err().is(ErrorKind::Corruption));
    }
}

TEST_CASE("BackupRepository", "[storage][backup]") {
    auto db = migrated_db();
    BackupRepository backups(db);

    auto older = make_map("m1", "v1", Timestamp(10));
    auto newer = make_map("m1", "v1", Timestamp(20));
    newer.title = "Newer";

    REQUIRE(backups.save(Backup{.backup_ref = make_backup_ref("m1", Timestamp(100)), .map_id = "m1",
                                .vault_id = "v1", .created_at = Timestamp(100), .payload = older}).is_ok());
    REQUIRE(backups.save(Backup{.backup_ref = make_backup_ref("m1", Timestamp(200)), .map_id = "m1",
                                .vault_id = "v1", .created_at = Timestamp(200), .payload = newer}).is_ok());

    SECTION("backups are listed newest first") {
        auto list = backups.list_by_map("m1").unwrap();
        REQUIRE(list.size() == 2);
        REQUIRE(list[0].payload.title == "Newer");
        REQUIRE(list[1].backup_ref == "m1@100");
    }

    SECTION("get by ref returns the stored payload") {
        auto backup = backups.get("m1@100").unwrap();
        REQUIRE(backup);
        REQUIRE(same_content(backup->payload, older));
        REQUIRE_FALSE(backups.get("m1@999").unwrap());
    }

    SECTION("resolution log") {
        auto entry = backups.log_resolution(ResolutionEntry{
            .id = 0, .map_id = "m1", .vault_id = "v1", .winner = Winner::Local,
            .backup_ref = std::string("m1@200"), .resolved_at = Timestamp(200)}).unwrap();
        REQUIRE(entry.id > 0);
        REQUIRE(backups.log_resolution(ResolutionEntry{
            .id = 0, .map_id = "m2", .vault_id = "v1", .winner = Winner::Remote,
            .backup_ref = std::nullopt, .resolved_at = Timestamp(300)}).is_ok());

        auto all = backups.resolutions("").unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].map_id == "m2");
        REQUIRE_FALSE(all[0].backup_ref);

        auto only_m1 = backups.resolutions("m1").unwrap();
        REQUIRE(only_m1.size() == 1);
        REQUIRE(only_m1[0].winner == Winner::Local);
        REQUIRE(only_m1[0].backup_ref == "m1@200");
    }
}

TEST_CASE("LockRepository", "[storage][lock]") {
    auto db = migrated_db();
    LockRepository locks(db);

    const Lock first{.lock_id = "l1", .vault_id = "v1", .acquired_at = Timestamp(100),
                     .expires_at = Timestamp(200), .operation = "full-pull"};
    const Lock second{.lock_id = "l2", .vault_id = "v1", .acquired_at = Timestamp(150),
                      .expires_at = Timestamp(250), .operation = "merge"};

    REQUIRE(locks.insert_if_free(first, Timestamp(100)).unwrap());

    SECTION("an unexpired lock blocks others") {
        REQUIRE_FALSE(locks.insert_if_free(second, Timestamp(150)).unwrap());
        REQUIRE(locks.get("v1").unwrap()->lock_id == "l1");
    }

    SECTION("an expired lock is overwritten") {
        REQUIRE(locks.insert_if_free(second, Timestamp(201)).unwrap());
        REQUIRE(locks.get("v1").unwrap()->lock_id == "l2");
    }

    SECTION("remove only deletes the named lock") {
        REQUIRE_FALSE(locks.remove("v1", "l2").unwrap());
        REQUIRE(locks.remove("v1", "l1").unwrap());
        REQUIRE_FALSE(locks.get("v1").unwrap());
    }

    SECTION("the holder's device is stored with the lock") {
        Lock owned = second;
        owned.device_id = "device-b";
        REQUIRE(locks.insert_if_free(owned, Timestamp(201)).unwrap());
        REQUIRE(locks.get("v1").unwrap()->device_id == "device-b");
    }

    SECTION("the device id is created once") {
        const auto id = locks.device_id().unwrap();
        REQUIRE_FALSE(id.empty());
        REQUIRE(locks.device_id().unwrap() == id);
    }
}
