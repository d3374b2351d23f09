#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rxg::crypto {

struct ChaCha20Poly1305 {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;
};

// IETF ChaCha20-Poly1305 in combined mode: the returned buffer is the
// ciphertext followed by the TAG_SIZE authentication tag.
std::vector<uint8_t> ChaCha20Poly1305_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, ChaCha20Poly1305::NONCE_SIZE> nonce,
    std::span<const uint8_t, ChaCha20Poly1305::KEY_SIZE> key);

// Verifies the trailing tag and returns the plaintext. Throws IntegrityError
// on truncated input or tag mismatch; no partial plaintext is ever returned.
std::vector<uint8_t> ChaCha20Poly1305_Decrypt(
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, ChaCha20Poly1305::NONCE_SIZE> nonce,
    std::span<const uint8_t, ChaCha20Poly1305::KEY_SIZE> key);

}  // namespace rxg::crypto
