#pragma once

#include <algorithm>
#include <chrono>

namespace mindsync::sync {

/**
 * Delay before retry number `attempts` (1-based): base, 2*base, 4*base,
 * ... capped at `cap`.
 */
[[nodiscard]] inline std::chrono::milliseconds backoff_delay(
    int attempts,
    std::chrono::milliseconds base,
    std::chrono::milliseconds cap
) {
    if (attempts <= 1) return std::min(base, cap);
    auto delay = base;
    for (int i = 1; i < attempts && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

} // namespace mindsync::sync
