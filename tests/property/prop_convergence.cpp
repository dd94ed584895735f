#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "support/test_device.hpp"
#include "remote/memory_remote.hpp"
#include "sync/backoff.hpp"
#include <algorithm>
#include <cstdlib>
#include <optional>

using namespace mindsync;
using namespace mindsync::testing;
using namespace std::chrono_literals;

namespace {

struct EditStep {
    bool on_b{false};
    bool add_node{false};
    bool sync_after{false};
    int gap{1};
};

} // namespace

namespace rc {

template<>
struct Arbitrary<EditStep> {
    static Gen<EditStep> arbitrary() {
        return gen::build<EditStep>(
            gen::set(&EditStep::on_b),
            gen::set(&EditStep::add_node),
            gen::set(&EditStep::sync_after),
            gen::set(&EditStep::gap, gen::inRange(1, 50))
        );
    }
};

} // namespace rc

TEST_CASE("Property: two devices converge on the latest edit", "[property][sync]") {
    rc::check("after syncing and reopening, both devices hold the most recent edit",
        [](const std::vector<EditStep>& steps) {
            ManualClock server(Timestamp(1000));
            remote::MemoryRemote backend(server);
            Device a(backend, Timestamp(1000));
            Device b(backend, Timestamp(1000));

            const auto vault_id = a.store->create_vault("Shared", "").unwrap().id;
            const auto map_id = a.store->create_map(vault_id, "Start").unwrap().id;
            RC_ASSERT(a.sync().synced == 1);
            RC_ASSERT(b.switcher.open_vault(vault_id).is_ok());

            std::optional<Map> latest;
            Timestamp now(2000);
            for (size_t i = 0; i < steps.size(); ++i) {
                const auto& step = steps[i];
                auto& device = step.on_b ? b : a;
                now = now + std::chrono::milliseconds(step.gap);
                device.clock.set(now);

                const auto label = "edit " + std::to_string(i);
                if (step.add_node) {
                    RC_ASSERT(device.store->add_node(map_id, std::nullopt, label).is_ok());
                } else {
                    RC_ASSERT(device.store->rename_map(map_id, label).is_ok());
                }
                latest = device.map(map_id);
                RC_ASSERT(latest->local_modified_at == now);

                if (step.sync_after) {
                    RC_ASSERT(device.sync().failed == 0);
                }
            }

            RC_ASSERT(a.sync().failed == 0);
            RC_ASSERT(b.sync().failed == 0);
            RC_ASSERT(a.sync().failed == 0);
            RC_ASSERT(a.store->pending_count().unwrap() == 0);
            RC_ASSERT(b.store->pending_count().unwrap() == 0);

            RC_ASSERT(a.switcher.open_vault(vault_id).is_ok());
            RC_ASSERT(b.switcher.open_vault(vault_id).is_ok());

            const auto on_a = a.map(map_id);
            const auto on_b = b.map(map_id);
            RC_ASSERT(same_content(on_a, on_b));
            RC_ASSERT(same_content(on_a, backend.read_file(vault_id, map_id).unwrap().map));
            if (latest) {
                RC_ASSERT(same_content(on_a, *latest));
            }
            return true;
        }
    );
}

TEST_CASE("Property: queued edits collapse into one operation", "[property][queue]") {
    rc::check("only the final state of a map is queued",
        [](const std::vector<int>& revisions) {
            ManualClock clock(Timestamp(1000));
            auto store = storage::LocalStore::open_memory(clock).unwrap();
            const auto vault_id = store->create_vault("Notes", "").unwrap().id;
            const auto map_id = store->create_map(vault_id, "Draft").unwrap().id;

            std::string last_title = "Draft";
            for (int revision : revisions) {
                clock.advance(1ms);
                last_title = "Draft " + std::to_string(revision);
                RC_ASSERT(store->rename_map(map_id, last_title).is_ok());
            }

            RC_ASSERT(store->pending_count().unwrap() == 1);
            auto op = store->pending_operation(map_id).unwrap();
            RC_ASSERT(op.has_value());
            RC_ASSERT(op->kind == OperationKind::Create);
            RC_ASSERT(op->base_revision.empty());
            RC_ASSERT(op->payload->title == last_title);
            return true;
        }
    );
}

TEST_CASE("Property: retry delays grow and stay capped", "[property][backoff]") {
    rc::check("backoff is non-decreasing and bounded",
        [](int raw_base, int raw_cap) {
            const auto base = std::chrono::milliseconds(1 + std::abs(raw_base % 5000));
            const auto cap = std::max(base, std::chrono::milliseconds(1 + std::abs(raw_cap % 120000)));

            auto previous = std::chrono::milliseconds(0);
            for (int attempts = 1; attempts <= 40; ++attempts) {
                const auto delay = sync::backoff_delay(attempts, base, cap);
                RC_ASSERT(delay >= previous);
                RC_ASSERT(delay >= base);
                RC_ASSERT(delay <= cap);
                previous = delay;
            }
            RC_ASSERT(sync::backoff_delay(40, base, cap) == cap);
            return true;
        }
    );
}
