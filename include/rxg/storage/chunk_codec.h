#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "rxg/crypto/chacha20_poly1305.h"
#include "rxg/crypto/master_key.h"

namespace rxg::storage {

struct ChunkKeyMaterial {
  std::array<uint8_t, rxg::crypto::ChaCha20Poly1305::KEY_SIZE> key{};
  std::array<uint8_t, rxg::crypto::ChaCha20Poly1305::NONCE_SIZE> nonce{};
  ~ChunkKeyMaterial();
};

struct EncryptedChunk {
  std::string hash;
  std::vector<uint8_t> ciphertext;
};

// Deterministic content-addressed chunk encryption. Identical plaintext under
// the same master key always yields identical ciphertext, which is what makes
// deduplication possible; it also reveals equality of chunks to anyone who
// can read the store.
class ChunkCodec {
public:
  explicit ChunkCodec(std::unique_ptr<rxg::crypto::MasterKey> master_key);

  static std::string ComputeHash(std::span<const uint8_t> plaintext);

  // HKDF-SHA256(master, info = "rxguard:chunk:" + hash) -> key || nonce.
  ChunkKeyMaterial DeriveKeyAndNonce(std::string_view hash) const;

  EncryptedChunk Encrypt(std::span<const uint8_t> plaintext) const;

  // Throws IntegrityError when the ciphertext, the hash or the key do not match.
  std::vector<uint8_t> Decrypt(std::string_view hash, std::span<const uint8_t> ciphertext) const;

private:
  std::unique_ptr<rxg::crypto::MasterKey> master_key_;
};

}  // namespace rxg::storage
