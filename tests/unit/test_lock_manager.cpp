#include <catch2/catch_test_macros.hpp>
#include "sync/lock_manager.hpp"

using namespace mindsync;
using namespace mindsync::sync;
using namespace std::chrono_literals;

TEST_CASE("LockManager grants one holder per vault", "[lock]") {
    ManualClock clock(Timestamp(10'000));
    auto store = storage::LocalStore::open_memory(clock).unwrap();
    LockManager locks(*store);

    auto first = locks.acquire("v1", "full-pull", 30s);
    REQUIRE(first.is_ok());
    REQUIRE(first.unwrap().expires_at == Timestamp(40'000));
    REQUIRE(first.unwrap().operation == "full-pull");

    SECTION("a second acquire fails with LockHeld") {
        auto second = locks.acquire("v1", "merge", 30s);
        REQUIRE(second.is_err());
        REQUIRE(second.unwrap_err().is(ErrorKind::LockHeld));
    }

    SECTION("other vaults are independent") {
        REQUIRE(locks.acquire("v2", "merge", 30s).is_ok());
    }

    SECTION("is_locked reports the holder") {
        auto status = locks.is_locked("v1").unwrap();
        REQUIRE(status.locked);
        REQUIRE(status.holder->lock_id == first.unwrap().lock_id);
        REQUIRE_FALSE(locks.is_locked("v2").unwrap().locked);
    }

    SECTION("release frees the vault") {
        REQUIRE(locks.release(first.unwrap()).is_ok());
        REQUIRE_FALSE(locks.is_locked("v1").unwrap().locked);
        REQUIRE(locks.acquire("v1", "merge", 30s).is_ok());
    }

    SECTION("an expired lock is overwritten by the next acquire") {
        clock.set(Timestamp(40'001));
        REQUIRE_FALSE(locks.is_locked("v1").unwrap().locked);

        auto taken = locks.acquire("v1", "merge", 30s);
        REQUIRE(taken.is_ok());
        REQUIRE(taken.unwrap().lock_id != first.unwrap().lock_id);

        // The stale holder releasing late must not free the new lock.
        REQUIRE(locks.release(first.unwrap()).is_ok());
        REQUIRE(locks.is_locked("v1").unwrap().locked);
    }

    SECTION("a lock is still held at its exact expiry time") {
        clock.set(Timestamp(40'000));
        REQUIRE(locks.acquire("v1", "merge", 30s).is_err());
    }
}

TEST_CASE("LockManager rejects a non-positive lease", "[lock]") {
    ManualClock clock;
    auto store = storage::LocalStore::open_memory(clock).unwrap();
    LockManager locks(*store);

    auto result = locks.acquire("v1", "merge", 0ms);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().is(ErrorKind::InvalidArgument));
}

TEST_CASE("LockGuard releases on scope exit", "[lock]") {
    ManualClock clock(Timestamp(500));
    auto store = storage::LocalStore::open_memory(clock).unwrap();
    LockManager locks(*store);

    {
        LockGuard guard(locks, locks.acquire("v1", "repull", 1min).unwrap());
        REQUIRE(locks.is_locked("v1").unwrap().locked);
        REQUIRE(guard.lock().operation == "repull");
    }
    REQUIRE_FALSE(locks.is_locked("v1").unwrap().locked);

    SECTION("explicit release happens once") {
        LockGuard guard(locks, locks.acquire("v1", "merge", 1min).unwrap());
        REQUIRE(guard.release().is_ok());
        REQUIRE(guard.release().is_ok());
        REQUIRE_FALSE(locks.is_locked("v1").unwrap().locked);
    }
}
