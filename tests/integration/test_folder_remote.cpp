#include <catch2/catch_test_macros.hpp>
#include "remote/folder_remote.hpp"
#include "support/test_device.hpp"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace mindsync;
using namespace mindsync::testing;

namespace {

Map sample_map(const std::string& id, const std::string& title, Timestamp modified) {
    auto map = create_map(id, "vault-1", title, modified);
    map.nodes.push_back(create_node(id + "-root", title));
    return map;
}

} // namespace

TEST_CASE("FolderRemote stores one file per map", "[integration][folder]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ManualClock clock(Timestamp(10'000));
    auto remote = remote::FolderRemote::open(dir.path(), clock).unwrap();

    REQUIRE(remote->list_files("vault-1").unwrap().empty());
    REQUIRE(remote->get_vault_timestamp("vault-1").unwrap() == Timestamp{});

    auto written = remote->write_file("vault-1", "map-a", sample_map("map-a", "Alpha", Timestamp(500)), "");
    REQUIRE(written.is_ok());
    REQUIRE(written.unwrap().modified_time == Timestamp(500));
    REQUIRE_FALSE(written.unwrap().revision.empty());
    REQUIRE(QFile::exists(QDir(dir.path()).filePath("vault-1/map-a.json")));

    SECTION("listing and reading agree on revision and time") {
        auto files = remote->list_files("vault-1").unwrap();
        REQUIRE(files.size() == 1);
        REQUIRE(files.front().file_id == "map-a");
        REQUIRE(files.front().revision == written.unwrap().revision);
        REQUIRE(files.front().modified_time == Timestamp(500));

        auto read = remote->read_file("vault-1", "map-a").unwrap();
        REQUIRE(read.map.title == "Alpha");
        REQUIRE(read.map.nodes.size() == 1);
        REQUIRE(read.revision == written.unwrap().revision);
    }

    SECTION("the revision tracks content") {
        auto same = remote->write_file("vault-1", "map-a", sample_map("map-a", "Alpha", Timestamp(500)),
                                       written.unwrap().revision);
        REQUIRE(same.unwrap().revision == written.unwrap().revision);

        auto changed = remote->write_file("vault-1", "map-a", sample_map("map-a", "Beta", Timestamp(600)),
                                          written.unwrap().revision);
        REQUIRE(changed.unwrap().revision != written.unwrap().revision);
    }

    SECTION("a stale expected revision is a conflict") {
        auto stale = remote->write_file("vault-1", "map-a", sample_map("map-a", "Beta", Timestamp(600)),
                                        std::string("not-the-revision"));
        REQUIRE(stale.is_err());
        REQUIRE(stale.unwrap_err().is(ErrorKind::Conflict));

        auto exists = remote->write_file("vault-1", "map-a", sample_map("map-a", "Beta", Timestamp(600)), "");
        REQUIRE(exists.unwrap_err().is(ErrorKind::Conflict));

        REQUIRE(remote->read_file("vault-1", "map-a").unwrap().map.title == "Alpha");
    }

    SECTION("an unconditional write always lands") {
        REQUIRE(remote->write_file("vault-1", "map-a", sample_map("map-a", "Forced", Timestamp(700)),
                                   std::nullopt).is_ok());
        REQUIRE(remote->read_file("vault-1", "map-a").unwrap().map.title == "Forced");
    }

    SECTION("every change advances the vault timestamp") {
        const auto first = remote->get_vault_timestamp("vault-1").unwrap();
        REQUIRE(first == Timestamp(10'000));

        REQUIRE(remote->write_file("vault-1", "map-b", sample_map("map-b", "Bravo", Timestamp(800)), "").is_ok());
        const auto second = remote->get_vault_timestamp("vault-1").unwrap();
        REQUIRE(second > first);

        REQUIRE(remote->delete_file("vault-1", "map-b").is_ok());
        REQUIRE(remote->get_vault_timestamp("vault-1").unwrap() > second);
    }

    SECTION("deleting and reading missing files") {
        REQUIRE(remote->delete_file("vault-1", "map-a").is_ok());
        REQUIRE(remote->read_file("vault-1", "map-a").unwrap_err().is(ErrorKind::NotFound));
        REQUIRE(remote->delete_file("vault-1", "map-a").unwrap_err().is(ErrorKind::NotFound));
        REQUIRE(remote->list_files("vault-1").unwrap().empty());
    }

    SECTION("ids that escape the vault folder are rejected") {
        auto escaped = remote->write_file("vault-1", "../elsewhere", sample_map("x", "X", Timestamp(1)), "");
        REQUIRE(escaped.unwrap_err().is(ErrorKind::InvalidArgument));
        REQUIRE(remote->read_file("vault-1", ".vault").unwrap_err().is(ErrorKind::InvalidArgument));
    }

    SECTION("vault ids are checked by every operation") {
        for (const std::string bad : {"..", "../vault-1", ".hidden", ""}) {
            REQUIRE(remote->list_files(bad).unwrap_err().is(ErrorKind::InvalidArgument));
            REQUIRE(remote->get_vault_timestamp(bad).unwrap_err().is(ErrorKind::InvalidArgument));
            REQUIRE(remote->read_file(bad, "map-a").unwrap_err().is(ErrorKind::InvalidArgument));
            REQUIRE(remote->write_file(bad, "map-a", sample_map("map-a", "A", Timestamp(1)), std::nullopt)
                        .unwrap_err().is(ErrorKind::InvalidArgument));
            REQUIRE(remote->delete_file(bad, "map-a").unwrap_err().is(ErrorKind::InvalidArgument));
            REQUIRE(remote->read_lock(bad).unwrap_err().is(ErrorKind::InvalidArgument));
        }
    }

    SECTION("an undecodable file is reported as corruption") {
        QFile broken(QDir(dir.path()).filePath("vault-1/map-a.json"));
        REQUIRE(broken.open(QIODevice::WriteOnly | QIODevice::Truncate));
        broken.write("{ not json");
        broken.close();

        REQUIRE(remote->read_file("vault-1", "map-a").unwrap_err().is(ErrorKind::Corruption));
        REQUIRE(remote->list_files("vault-1").unwrap().size() == 1);
    }
}

TEST_CASE("FolderRemote reports a missing root as a network failure", "[integration][folder][network]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ManualClock clock(Timestamp(10'000));
    const auto root = QDir(dir.path()).filePath("share");
    auto remote = remote::FolderRemote::open(root, clock).unwrap();

    REQUIRE(QDir(root).removeRecursively());

    REQUIRE(remote->list_files("vault-1").unwrap_err().is(ErrorKind::Network));
    REQUIRE(remote->get_vault_timestamp("vault-1").unwrap_err().is(ErrorKind::Network));
    REQUIRE(remote->write_file("vault-1", "map-a", sample_map("map-a", "A", Timestamp(1)), "")
                .unwrap_err().is(ErrorKind::Network));
}

TEST_CASE("FolderRemote keeps the vault lock marker beside the maps", "[integration][folder][lock]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ManualClock server(Timestamp(1000));
    auto share = remote::FolderRemote::open(dir.path(), server).unwrap();
    Device a(*share, Timestamp(10'000));
    Device b(*share, Timestamp(10'000));

    auto held = a.locks.acquire("vault-1", "merge", std::chrono::seconds(30));
    REQUIRE(held.is_ok());
    REQUIRE(QFile::exists(QDir(dir.path()).filePath("vault-1/.lock")));
    REQUIRE(share->list_files("vault-1").unwrap().empty());
    REQUIRE(share->get_vault_timestamp("vault-1").unwrap() == Timestamp{});

    auto marker = share->read_lock("vault-1").unwrap();
    REQUIRE(marker.has_value());
    REQUIRE(*marker == held.unwrap());

    REQUIRE(b.locks.acquire("vault-1", "full-pull", std::chrono::seconds(30))
                .unwrap_err().is(ErrorKind::LockHeld));

    b.clock.set(Timestamp(40'001));
    auto taken = b.locks.acquire("vault-1", "full-pull", std::chrono::seconds(30));
    REQUIRE(taken.is_ok());
    REQUIRE_FALSE(share->release_lock(held.unwrap()).unwrap());
    REQUIRE(share->release_lock(taken.unwrap()).unwrap());
    REQUIRE_FALSE(QFile::exists(QDir(dir.path()).filePath("vault-1/.lock")));
}

TEST_CASE("Two devices converge through a shared folder", "[integration][folder][sync]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ManualClock server(Timestamp(1000));
    auto share = remote::FolderRemote::open(dir.path(), server).unwrap();

    Device a(*share, Timestamp(1000));
    Device b(*share, Timestamp(1000));

    const auto vault_id = a.store->create_vault("Shared", dir.path().toStdString()).unwrap().id;
    auto map = a.store->create_map(vault_id, "Plan").unwrap();
    auto root = a.store->add_node(map.id, std::nullopt, "Goal").unwrap();
    REQUIRE(a.store->add_node(map.id, root.id, "Step", "first things first").is_ok());
    REQUIRE(a.sync().synced == 1);

    auto opened = b.switcher.open_vault(vault_id);
    REQUIRE(opened.is_ok());
    REQUIRE(opened.unwrap().pulled == 1);
    REQUIRE(same_content(a.map(map.id), b.map(map.id)));

    a.clock.set(Timestamp(3000));
    REQUIRE(a.store->rename_map(map.id, "Plan v2").is_ok());
    REQUIRE(a.sync().synced == 1);

    auto merged = b.switcher.open_vault(vault_id);
    REQUIRE(merged.is_ok());
    REQUIRE(merged.unwrap().pulled == 1);
    REQUIRE(b.map(map.id).title == "Plan v2");
}
