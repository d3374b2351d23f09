#include "rxg/crypto/master_key.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <vector>

#include <sodium.h>

#include "rxg/common.h"
#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/io_util.h"

namespace rxg::crypto {

MasterKey::MasterKey(std::span<const uint8_t, kSize> bytes) noexcept {
  std::copy(bytes.begin(), bytes.end(), bytes_.begin());
}

MasterKey::~MasterKey() {
  sodium_memzero(bytes_.data(), bytes_.size());
}

std::unique_ptr<MasterKey> MasterKey::Generate() {
  std::array<uint8_t, kSize> fresh{};
  SystemRandomBytes(fresh);
  auto key = std::make_unique<MasterKey>(std::span<const uint8_t, kSize>(fresh));
  sodium_memzero(fresh.data(), fresh.size());
  return key;
}

std::unique_ptr<MasterKey> LoadMasterKey(const std::filesystem::path& path) {
  std::vector<uint8_t> raw;
  try {
    raw = rxg::orchestrator::ReadFileBytes(path);
  } catch (const Error& err) {
    throw KeyError(std::string(errors::msg::kMasterKeyUnreadable) + ": " +
                   PathToUtf8String(path) + ": " + err.what());
  }
  if (raw.size() != MasterKey::kSize) {
    sodium_memzero(raw.data(), raw.size());
    throw KeyError(std::string(errors::msg::kMasterKeyLength) + ": expected " +
                   std::to_string(MasterKey::kSize) + " bytes, found " +
                   std::to_string(raw.size()));
  }
  auto key = std::make_unique<MasterKey>(std::span<const uint8_t, MasterKey::kSize>(raw.data(), MasterKey::kSize));
  sodium_memzero(raw.data(), raw.size());
  return key;
}

std::unique_ptr<MasterKey> LoadOrCreateMasterKey(const std::filesystem::path& path) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    throw KeyError(std::string(errors::msg::kMasterKeyUnreadable) + ": " +
                   PathToUtf8String(path) + ": " + ec.message());
  }
  if (exists) {
    return LoadMasterKey(path);
  }
  auto key = MasterKey::Generate();
  auto bytes = key->Bytes();
  rxg::orchestrator::WritePrivateFile(path, std::span<const uint8_t>(bytes.data(), bytes.size()));
  return key;
}

}  // namespace rxg::crypto
