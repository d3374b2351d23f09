#pragma once

#include <cstdint>
#include <span>

namespace rxg::crypto {

// Fills |out| with HKDF-SHA256(ikm, salt, info). An empty salt selects the
// RFC 5869 all-zero default. Output length is bounded by 255 * 32 bytes.
void HKDF_SHA256(std::span<const uint8_t> ikm,
                 std::span<const uint8_t> salt,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> out);

}  // namespace rxg::crypto
