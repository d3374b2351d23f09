#include "rxg/crypto/sha256.h"

#include <openssl/evp.h>

#include "rxg/error.h"

namespace rxg::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1 ||
      digest_len != digest.size()) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "SHA-256 digest failed");
  }
  return digest;
}

}  // namespace rxg::crypto
