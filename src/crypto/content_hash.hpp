#pragma once

#include "core/result.hpp"
#include <sodium.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mindsync::crypto {

// BLAKE2b digest length used for content revisions (128 bits).
constexpr size_t REVISION_HASH_SIZE = 16;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * Hex BLAKE2b digest of `bytes`; equal content always yields the same
 * revision string.
 */
[[nodiscard]] std::string content_revision(std::string_view bytes);

} // namespace mindsync::crypto
