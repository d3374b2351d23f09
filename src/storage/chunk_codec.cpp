#include "rxg/storage/chunk_codec.h"

#include <algorithm>
#include <stdexcept>

#include <sodium.h>

#include "rxg/common.h"
#include "rxg/crypto/content_hash.h"
#include "rxg/crypto/hkdf.h"
#include "rxg/error.h"
#include "rxg/errors.h"

namespace rxg::storage {

namespace {
constexpr std::string_view kChunkInfoPrefix = "rxguard:chunk:";
constexpr size_t kDerivedLength =
    rxg::crypto::ChaCha20Poly1305::KEY_SIZE + rxg::crypto::ChaCha20Poly1305::NONCE_SIZE;
}  // namespace

ChunkKeyMaterial::~ChunkKeyMaterial() {
  sodium_memzero(key.data(), key.size());
  sodium_memzero(nonce.data(), nonce.size());
}

ChunkCodec::ChunkCodec(std::unique_ptr<rxg::crypto::MasterKey> master_key)
    : master_key_(std::move(master_key)) {
  if (!master_key_) {
    throw std::invalid_argument("ChunkCodec requires a master key");
  }
}

std::string ChunkCodec::ComputeHash(std::span<const uint8_t> plaintext) {
  return rxg::crypto::ContentHash(plaintext);
}

ChunkKeyMaterial ChunkCodec::DeriveKeyAndNonce(std::string_view hash) const {
  std::string info(kChunkInfoPrefix);
  info.append(hash);

  std::array<uint8_t, kDerivedLength> okm{};
  auto master = master_key_->Bytes();
  rxg::crypto::HKDF_SHA256(std::span<const uint8_t>(master.data(), master.size()),
                           std::span<const uint8_t>(), AsByteSpan(info), okm);

  ChunkKeyMaterial material;
  std::copy(okm.begin(), okm.begin() + material.key.size(), material.key.begin());
  std::copy(okm.begin() + material.key.size(), okm.end(), material.nonce.begin());
  sodium_memzero(okm.data(), okm.size());
  return material;
}

EncryptedChunk ChunkCodec::Encrypt(std::span<const uint8_t> plaintext) const {
  EncryptedChunk out;
  out.hash = ComputeHash(plaintext);
  auto material = DeriveKeyAndNonce(out.hash);
  out.ciphertext = rxg::crypto::ChaCha20Poly1305_Encrypt(plaintext, AsByteSpan(out.hash),
                                                        material.nonce, material.key);
  return out;
}

std::vector<uint8_t> ChunkCodec::Decrypt(std::string_view hash,
                                         std::span<const uint8_t> ciphertext) const {
  auto material = DeriveKeyAndNonce(hash);
  return rxg::crypto::ChaCha20Poly1305_Decrypt(ciphertext, AsByteSpan(hash), material.nonce,
                                               material.key);
}

}  // namespace rxg::storage
