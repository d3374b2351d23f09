#include "rxg/crypto/chacha20_poly1305.h"

#include <string>

#include <sodium.h>

#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/errors.h"

namespace rxg::crypto {

static_assert(ChaCha20Poly1305::KEY_SIZE == crypto_aead_chacha20poly1305_ietf_KEYBYTES);
static_assert(ChaCha20Poly1305::NONCE_SIZE == crypto_aead_chacha20poly1305_ietf_NPUBBYTES);
static_assert(ChaCha20Poly1305::TAG_SIZE == crypto_aead_chacha20poly1305_ietf_ABYTES);

std::vector<uint8_t> ChaCha20Poly1305_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, ChaCha20Poly1305::NONCE_SIZE> nonce,
    std::span<const uint8_t, ChaCha20Poly1305::KEY_SIZE> key) {
  EnsureCryptoInitialized();
  std::vector<uint8_t> sealed(plaintext.size() + ChaCha20Poly1305::TAG_SIZE);
  unsigned long long sealed_len = 0;
  int ret = crypto_aead_chacha20poly1305_ietf_encrypt(
      sealed.data(),
      &sealed_len,
      plaintext.data(),
      plaintext.size(),
      aad.empty() ? nullptr : aad.data(),
      aad.size(),
      nullptr,
      nonce.data(),
      key.data());
  if (ret != 0) {
    throw Error{ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "ChaCha20-Poly1305 encryption failed"};
  }
  sealed.resize(static_cast<size_t>(sealed_len));
  return sealed;
}

std::vector<uint8_t> ChaCha20Poly1305_Decrypt(
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, ChaCha20Poly1305::NONCE_SIZE> nonce,
    std::span<const uint8_t, ChaCha20Poly1305::KEY_SIZE> key) {
  if (sealed.size() < ChaCha20Poly1305::TAG_SIZE) {
    throw IntegrityError(std::string(errors::msg::kChunkAuthenticationFailed) +
                         ": ciphertext shorter than tag");
  }
  EnsureCryptoInitialized();
  std::vector<uint8_t> plaintext(sealed.size() - ChaCha20Poly1305::TAG_SIZE);
  unsigned long long plaintext_len = 0;
  int ret = crypto_aead_chacha20poly1305_ietf_decrypt(
      plaintext.data(),
      &plaintext_len,
      nullptr,
      sealed.data(),
      sealed.size(),
      aad.empty() ? nullptr : aad.data(),
      aad.size(),
      nonce.data(),
      key.data());
  if (ret != 0) {
    sodium_memzero(plaintext.data(), plaintext.size());
    throw IntegrityError(std::string(errors::msg::kChunkAuthenticationFailed));
  }
  plaintext.resize(static_cast<size_t>(plaintext_len));
  return plaintext;
}

}  // namespace rxg::crypto
