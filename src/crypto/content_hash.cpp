#include "crypto/content_hash.hpp"
#include <array>

namespace mindsync::crypto {

std::string content_revision(std::string_view bytes) {
    std::array<unsigned char, REVISION_HASH_SIZE> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                       nullptr, 0);

    std::array<char, REVISION_HASH_SIZE * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data(), REVISION_HASH_SIZE * 2);
}

} // namespace mindsync::crypto
