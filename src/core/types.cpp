#include "core/types.hpp"

#include <type_traits>

// Header-only module; the assertions pin the value-type guarantees the
// storage and worker code rely on when copying ids and times across threads.

namespace mindsync {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(std::atomic<int64_t>::is_always_lock_free, "ManualClock needs a lock-free counter");

} // namespace mindsync
