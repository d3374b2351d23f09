#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rxg::storage {

// Sharded on-disk store of encrypted chunks: <root>/<hash[0:2]>/<hash>.bin.
// A stored chunk is never rewritten.
class ChunkStore {
public:
  explicit ChunkStore(std::filesystem::path root);

  const std::filesystem::path& Root() const { return root_; }

  // Throws Error{Validation} for a hash that is not lower-case hex of at least
  // two characters.
  std::filesystem::path ChunkPath(std::string_view hash) const;

  bool HasChunk(std::string_view hash) const;

  // Returns true when the chunk was written, false when it already existed.
  bool StoreChunk(std::string_view hash, std::span<const uint8_t> ciphertext);

  // Throws NotFoundError when the chunk is absent.
  std::vector<uint8_t> LoadChunk(std::string_view hash) const;

private:
  std::filesystem::path root_;
};

}  // namespace rxg::storage
