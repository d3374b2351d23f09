#include "rxg/crypto/hkdf.h"

#include <memory>
#include <string>

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include "rxg/error.h"

namespace rxg::crypto {

namespace {
constexpr size_t kMaxHkdfOutput = 255 * 32;
}  // namespace

void HKDF_SHA256(std::span<const uint8_t> ikm,
                 std::span<const uint8_t> salt,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> out) {
  if (out.empty() || out.size() > kMaxHkdfOutput) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "HKDF output length out of range");
  }
  EVP_PKEY_CTX* raw_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  if (!raw_ctx) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF) failed");
  }
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(raw_ctx, &EVP_PKEY_CTX_free);

  auto check = [](int status, const char* step) {
    if (status <= 0) {
      throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                  std::string("HKDF step failed: ") + step);
    }
  };

  check(EVP_PKEY_derive_init(ctx.get()), "derive_init");
  check(EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()), "set_md");
  if (!salt.empty()) {
    check(EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())),
          "set_salt");
  }
  check(EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())),
        "set_key");
  if (!info.empty()) {
    check(EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())),
          "set_info");
  }
  size_t len = out.size();
  check(EVP_PKEY_derive(ctx.get(), out.data(), &len), "derive");
  if (len != out.size()) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "HKDF derive produced unexpected length");
  }
}

}  // namespace rxg::crypto
