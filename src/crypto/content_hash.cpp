#include "rxg/crypto/content_hash.h"

#include <xxhash.h>

#include "rxg/common.h"

namespace rxg::crypto {

uint64_t ContentHash64(std::span<const uint8_t> data) noexcept {
  return static_cast<uint64_t>(XXH64(data.data(), data.size(), 0));
}

std::string ContentHash(std::span<const uint8_t> data) {
  // canonical form is big-endian, matching xxh64 hexdigest output
  XXH64_canonical_t canonical;
  XXH64_canonicalFromHash(&canonical, ContentHash64(data));
  return HexEncode(std::span<const uint8_t>(canonical.digest, sizeof(canonical.digest)));
}

}  // namespace rxg::crypto
