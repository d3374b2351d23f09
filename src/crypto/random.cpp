#include "rxg/crypto/random.h"

#include <mutex>

#include <sodium.h>

#include "rxg/error.h"

namespace rxg::crypto {

namespace {

struct RuntimeState {
  std::once_flag once;
  bool initialized{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

}  // namespace

void EnsureCryptoInitialized() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    if (sodium_init() < 0) {
      throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "sodium_init failed");
    }
    state.initialized = true;
  });
}

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  EnsureCryptoInitialized();
  randombytes_buf(out.data(), out.size());
}

uint32_t RandomUniform(uint32_t upper_bound) {
  if (upper_bound == 0) {
    throw Error(ErrorDomain::Validation, 0, "RandomUniform upper bound must be positive");
  }
  EnsureCryptoInitialized();
  return randombytes_uniform(upper_bound);
}

}  // namespace rxg::crypto
