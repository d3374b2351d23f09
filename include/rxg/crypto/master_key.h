#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace rxg::crypto {

// The repository secret. Held for the lifetime of the process and wiped on
// destruction; never copied.
class MasterKey {
public:
  static constexpr size_t kSize = 32;

  explicit MasterKey(std::span<const uint8_t, kSize> bytes) noexcept;
  ~MasterKey();

  MasterKey(const MasterKey&) = delete;
  MasterKey& operator=(const MasterKey&) = delete;
  MasterKey(MasterKey&&) = delete;
  MasterKey& operator=(MasterKey&&) = delete;

  [[nodiscard]] std::span<const uint8_t, kSize> Bytes() const noexcept { return bytes_; }

  static std::unique_ptr<MasterKey> Generate();

private:
  std::array<uint8_t, kSize> bytes_{};
};

// Loads the key at |path|, or generates and persists a fresh one with
// owner-only permissions when the file does not exist. Throws KeyError when
// an existing file is unreadable or not exactly kSize bytes.
std::unique_ptr<MasterKey> LoadOrCreateMasterKey(const std::filesystem::path& path);

// Loads an existing key; a missing file is a KeyError as well.
std::unique_ptr<MasterKey> LoadMasterKey(const std::filesystem::path& path);

}  // namespace rxg::crypto
