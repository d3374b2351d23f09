#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace rxg::crypto {

// Length of the hex content address produced by ContentHash.
inline constexpr size_t kContentHashHexLength = 16;

// XXH64 (seed 0) identity of |data|, rendered as 16 lower-case hex digits in
// canonical byte order. Used only for deduplication and as the chunk address;
// it is not collision resistant against adversarial input.
uint64_t ContentHash64(std::span<const uint8_t> data) noexcept;
std::string ContentHash(std::span<const uint8_t> data);

}  // namespace rxg::crypto
