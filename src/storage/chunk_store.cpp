#include "rxg/storage/chunk_store.h"

#include <cerrno>
#include <system_error>

#include "rxg/common.h"
#include "rxg/error.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/io_util.h"

namespace rxg::storage {

ChunkStore::ChunkStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path ChunkStore::ChunkPath(std::string_view hash) const {
  // The hash names a file, so it must never carry separators or dots.
  if (hash.size() < 2 || !IsHexDigest(hash)) {
    throw Error{ErrorDomain::Validation, errors::validation::kPathEscape,
                std::string(errors::msg::kChunkHashMalformed) + ": " + std::string(hash)};
  }
  std::string file_name(hash);
  file_name += ".bin";
  return root_ / std::string(hash.substr(0, 2)) / file_name;
}

bool ChunkStore::HasChunk(std::string_view hash) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(ChunkPath(hash), ec);
}

bool ChunkStore::StoreChunk(std::string_view hash, std::span<const uint8_t> ciphertext) {
  auto path = ChunkPath(hash);
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return false;
  }
  rxg::orchestrator::AtomicReplace(path, ciphertext);
  return true;
}

std::vector<uint8_t> ChunkStore::LoadChunk(std::string_view hash) const {
  auto path = ChunkPath(hash);
  try {
    return rxg::orchestrator::ReadFileBytes(path);
  } catch (const NotFoundError&) {
    throw NotFoundError(std::string(errors::msg::kChunkMissing) + ": " + std::string(hash), ENOENT);
  }
}

}  // namespace rxg::storage
