#include <catch2/catch_test_macros.hpp>
#include "support/scripted_remote.hpp"
#include "support/test_device.hpp"
#include "remote/memory_remote.hpp"

using namespace mindsync;
using namespace mindsync::testing;
using namespace std::chrono_literals;

namespace {

// Publishes `count` maps of a fresh vault from `author` and returns the vault id.
std::string publish_vault(Device& author, const std::string& name, int count) {
    auto vault_id = author.store->create_vault(name, "").unwrap().id;
    for (int i = 0; i < count; ++i) {
        auto map = author.store->create_map(vault_id, name + " " + std::to_string(i)).unwrap();
        REQUIRE(author.store->add_node(map.id, std::nullopt, "Root").is_ok());
    }
    REQUIRE(author.sync().synced == count);
    return vault_id;
}

} // namespace

TEST_CASE("Opening an uncached vault pulls every map", "[integration][vault]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    Device author(backend, Timestamp(1000));
    Device reader(backend, Timestamp(5000));

    const auto vault_id = publish_vault(author, "Research", 3);

    auto report = reader.switcher.open_vault(vault_id);
    REQUIRE(report.is_ok());
    REQUIRE(report.unwrap().full_pull);
    REQUIRE(report.unwrap().pulled == 3);
    REQUIRE_FALSE(report.unwrap().used_cached_state);

    REQUIRE(reader.switcher.state(vault_id) == sync::VaultState::Ready);
    REQUIRE(reader.switcher.current_vault() == vault_id);
    REQUIRE(reader.events.states_of(vault_id) ==
            std::vector<sync::VaultState>{sync::VaultState::Loading, sync::VaultState::Ready});

    auto vault = reader.store->get_vault(vault_id).unwrap();
    REQUIRE(vault->is_cached());
    REQUIRE(vault->map_count == 3);
    REQUIRE(vault->last_opened == Timestamp(5000));
    REQUIRE_FALSE(reader.locks.is_locked(vault_id).unwrap().locked);
    REQUIRE(reader.store->pending_count().unwrap() == 0);

    for (const auto& summary : reader.store->list_maps(vault_id).unwrap()) {
        REQUIRE(same_content(reader.map(summary.id), author.map(summary.id)));
        REQUIRE_FALSE(reader.state(summary.id).is_dirty());
    }

    SECTION("reopening without remote changes reads nothing") {
        const int reads = backend.read_count();
        auto again = reader.switcher.open_vault(vault_id).unwrap();
        REQUIRE_FALSE(again.full_pull);
        REQUIRE(again.pulled == 0);
        REQUIRE(backend.read_count() == reads);
    }

    SECTION("a merge pulls new and changed maps and drops deleted ones") {
        auto maps = author.store->list_maps(vault_id).unwrap();
        author.clock.set(Timestamp(6000));
        REQUIRE(author.store->rename_map(maps[0].id, "Changed").is_ok());
        REQUIRE(author.store->delete_map(maps[1].id).is_ok());
        auto added = author.store->create_map(vault_id, "Added").unwrap();
        REQUIRE(author.sync().synced == 3);

        auto merged = reader.switcher.open_vault(vault_id).unwrap();
        REQUIRE_FALSE(merged.full_pull);
        REQUIRE(merged.pulled == 2);
        REQUIRE(merged.removed == 1);
        REQUIRE(merged.skipped == 1);
        REQUIRE(merged.merged == 0);

        REQUIRE(reader.map(maps[0].id).title == "Changed");
        REQUIRE_FALSE(reader.store->get_map(maps[1].id).unwrap().has_value());
        REQUIRE(reader.map(added.id).title == "Added");
    }
}

TEST_CASE("A held vault lock opens on cached state", "[integration][vault][lock]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    Device author(backend, Timestamp(1000));
    Device reader(backend, Timestamp(5000));

    const auto vault_id = publish_vault(author, "Locked", 2);

    SECTION("for a vault never cached") {
        REQUIRE(reader.locks.acquire(vault_id, "other", 1min).is_ok());

        auto report = reader.switcher.open_vault(vault_id).unwrap();
        REQUIRE(report.full_pull);
        REQUIRE(report.used_cached_state);
        REQUIRE(report.pulled == 0);
        REQUIRE(reader.switcher.state(vault_id) == sync::VaultState::Ready);
        REQUIRE_FALSE(reader.store->get_vault(vault_id).unwrap()->is_cached());
    }

    SECTION("for a stale cached vault until the lease expires") {
        REQUIRE(reader.switcher.open_vault(vault_id).is_ok());
        auto first = author.store->list_maps(vault_id).unwrap().front();
        author.clock.set(Timestamp(7000));
        REQUIRE(author.store->rename_map(first.id, "Newer").is_ok());
        REQUIRE(author.sync().synced == 1);

        REQUIRE(reader.locks.acquire(vault_id, "other", 1min).is_ok());
        auto blocked = reader.switcher.open_vault(vault_id).unwrap();
        REQUIRE(blocked.used_cached_state);
        REQUIRE(reader.map(first.id).title != "Newer");

        reader.clock.advance(2min);
        auto merged = reader.switcher.open_vault(vault_id).unwrap();
        REQUIRE_FALSE(merged.used_cached_state);
        REQUIRE(merged.pulled == 1);
        REQUIRE(reader.map(first.id).title == "Newer");
    }
}

TEST_CASE("An unreachable backend opens the vault on cached state", "[integration][vault][network]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    Device author(backend, Timestamp(1000));
    Device reader(backend, Timestamp(5000));

    const auto vault_id = publish_vault(author, "Travel", 2);
    REQUIRE(reader.switcher.open_vault(vault_id).is_ok());

    backend.set_online(false);
    auto report = reader.switcher.open_vault(vault_id);
    REQUIRE(report.is_ok());
    REQUIRE(report.unwrap().used_cached_state);
    REQUIRE(reader.switcher.state(vault_id) == sync::VaultState::Ready);
    REQUIRE(reader.store->list_maps(vault_id).unwrap().size() == 2);

    SECTION("a vault never cached opens empty") {
        Device newcomer(backend, Timestamp(5000));
        auto empty = newcomer.switcher.open_vault(vault_id).unwrap();
        REQUIRE(empty.used_cached_state);
        REQUIRE(newcomer.store->list_maps(vault_id).unwrap().empty());
        REQUIRE_FALSE(newcomer.store->get_vault(vault_id).unwrap()->is_cached());

        auto lock_state = newcomer.locks.is_locked(vault_id);
        REQUIRE(lock_state.is_err());
        REQUIRE(lock_state.unwrap_err().is(ErrorKind::Network));
        backend.set_online(true);
        REQUIRE_FALSE(newcomer.locks.is_locked(vault_id).unwrap().locked);
    }
}

TEST_CASE("Cancelling an open stops between maps and closes the vault", "[integration][vault][cancel]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    ScriptedRemote scripted(backend);
    Device author(backend, Timestamp(1000));
    Device reader(scripted, Timestamp(5000));

    const auto vault_id = publish_vault(author, "Archive", 5);
    scripted.after_read = [&](int reads) {
        if (reads == 2) reader.switcher.cancel();
    };

    auto report = reader.switcher.open_vault(vault_id);
    REQUIRE(report.is_err());
    REQUIRE(report.unwrap_err().is(ErrorKind::Cancelled));

    REQUIRE(reader.switcher.state(vault_id) == sync::VaultState::Closed);
    REQUIRE_FALSE(reader.switcher.current_vault().has_value());
    REQUIRE_FALSE(reader.locks.is_locked(vault_id).unwrap().locked);
    REQUIRE(reader.store->list_maps(vault_id).unwrap().size() == 2);
    REQUIRE_FALSE(reader.store->get_vault(vault_id).unwrap()->is_cached());

    // A later open starts over and completes.
    scripted.after_read = nullptr;
    auto retried = reader.switcher.open_vault(vault_id);
    REQUIRE(retried.is_ok());
    REQUIRE(retried.unwrap().pulled == 5);
    REQUIRE(reader.store->list_maps(vault_id).unwrap().size() == 5);
}

TEST_CASE("A cancel issued before a queued open starts aborts it", "[integration][vault][cancel]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    Device author(backend, Timestamp(1000));
    Device reader(backend, Timestamp(5000));

    const auto vault_id = publish_vault(author, "Archive", 2);

    const auto reads_before = backend.read_count();
    const auto queued = reader.switcher.ticket();
    reader.switcher.cancel();

    auto report = reader.switcher.open_vault(vault_id, queued);
    REQUIRE(report.is_err());
    REQUIRE(report.unwrap_err().is(ErrorKind::Cancelled));
    REQUIRE(reader.switcher.state(vault_id) == sync::VaultState::Closed);
    REQUIRE_FALSE(reader.switcher.current_vault().has_value());
    REQUIRE(backend.read_count() == reads_before);

    // An open queued after the cancel is unaffected by it.
    auto later = reader.switcher.open_vault(vault_id, reader.switcher.ticket());
    REQUIRE(later.is_ok());
    REQUIRE(later.unwrap().pulled == 2);
}

TEST_CASE("A vault whose open was cancelled is evicted on the next switch", "[integration][vault][cancel][switch]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    ScriptedRemote scripted(backend);
    Device author(backend, Timestamp(1000));
    Device reader(scripted, Timestamp(5000));

    const auto archive = publish_vault(author, "Archive", 5);
    const auto work = publish_vault(author, "Work", 1);

    scripted.after_read = [&](int reads) {
        if (reads == 2) reader.switcher.cancel();
    };
    REQUIRE(reader.switcher.open_vault(archive).unwrap_err().is(ErrorKind::Cancelled));
    REQUIRE(reader.store->list_maps(archive).unwrap().size() == 2);
    scripted.after_read = nullptr;

    auto report = reader.switcher.switch_vault(work);
    REQUIRE(report.is_ok());
    REQUIRE(report.unwrap().pulled == 1);
    REQUIRE(reader.switcher.current_vault() == work);
    REQUIRE(reader.store->list_maps(archive).unwrap().empty());
    REQUIRE(reader.switcher.state(archive) == sync::VaultState::Closed);

    // The next switch back pulls the whole vault.
    auto back = reader.switcher.switch_vault(archive).unwrap();
    REQUIRE(back.full_pull);
    REQUIRE(back.pulled == 5);
}

TEST_CASE("Switching vaults evicts the clean maps of the previous one", "[integration][vault][switch]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    Device author(backend, Timestamp(1000));

    const auto home = publish_vault(author, "Home", 2);
    const auto work = publish_vault(author, "Work", 1);

    SECTION("with eviction enabled") {
        Device reader(backend, Timestamp(5000));
        REQUIRE(reader.switcher.open_vault(home).is_ok());
        auto edited = reader.store->list_maps(home).unwrap().front();
        REQUIRE(reader.store->rename_map(edited.id, "Unsynced").is_ok());

        auto report = reader.switcher.switch_vault(work);
        REQUIRE(report.is_ok());
        REQUIRE(reader.switcher.current_vault() == work);
        REQUIRE(reader.switcher.state(home) == sync::VaultState::Closed);
        REQUIRE(reader.switcher.state(work) == sync::VaultState::Ready);

        auto remaining = reader.store->list_maps(home).unwrap();
        REQUIRE(remaining.size() == 1);
        REQUIRE(remaining.front().id == edited.id);
        REQUIRE_FALSE(reader.store->get_vault(home).unwrap()->is_cached());

        // Coming back pulls the evicted maps again.
        auto back = reader.switcher.switch_vault(home).unwrap();
        REQUIRE(back.full_pull);
        REQUIRE(reader.store->list_maps(home).unwrap().size() == 2);
        REQUIRE(reader.map(edited.id).title == "Unsynced");
    }

    SECTION("with eviction disabled") {
        sync::SyncConfig config;
        config.evict_on_switch = false;
        Device reader(backend, Timestamp(5000), config);
        REQUIRE(reader.switcher.open_vault(home).is_ok());

        REQUIRE(reader.switcher.switch_vault(work).is_ok());
        REQUIRE(reader.store->list_maps(home).unwrap().size() == 2);
        REQUIRE(reader.store->get_vault(home).unwrap()->is_cached());
    }
}

TEST_CASE("Re-pulling a vault replaces all local state", "[integration][vault][repull]") {
    ManualClock server(Timestamp(1000));
    remote::MemoryRemote backend(server);
    Device author(backend, Timestamp(1000));
    Device reader(backend, Timestamp(5000));

    const auto vault_id = publish_vault(author, "Garden", 2);
    REQUIRE(reader.switcher.open_vault(vault_id).is_ok());

    auto first = reader.store->list_maps(vault_id).unwrap().front();
    REQUIRE(reader.store->rename_map(first.id, "Local only").is_ok());
    REQUIRE(reader.store->create_map(vault_id, "Never pushed").is_ok());

    auto report = reader.switcher.repull_vault(vault_id);
    REQUIRE(report.is_ok());
    REQUIRE(report.unwrap().full_pull);
    REQUIRE(report.unwrap().pulled == 2);

    REQUIRE(reader.store->pending_count().unwrap() == 0);
    REQUIRE(reader.store->list_maps(vault_id).unwrap().size() == 2);
    REQUIRE(same_content(reader.map(first.id), author.map(first.id)));
    REQUIRE(reader.switcher.state(vault_id) == sync::VaultState::Ready);
}
