#pragma once

#include <cstdint>
#include <span>

namespace rxg::crypto {

// Runs sodium_init() once per process. Throws rxg::Error when libsodium cannot
// be initialised.
void EnsureCryptoInitialized();

void SystemRandomBytes(std::span<uint8_t> out);

// Uniform value in [0, upper_bound).
uint32_t RandomUniform(uint32_t upper_bound);

}  // namespace rxg::crypto
