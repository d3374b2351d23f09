#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rxg::snapshot {

inline constexpr int kManifestVersion = 1;

struct FileEntry {
  std::string path;            // absolute source path at snapshot time
  uint64_t size{0};
  int64_t mtime_ns{0};
  std::vector<std::string> chunks;  // concatenation in order rebuilds the file
};

struct Snapshot {
  std::string id;
  std::string created_at;  // ISO-8601 UTC
  int version{kManifestVersion};
  std::optional<std::string> label;
  std::vector<FileEntry> files;
};

// Pretty-printed JSON document (two-space indent, trailing newline).
std::string SerializeManifest(const Snapshot& snapshot);

// Throws CorruptManifestError on malformed JSON, missing fields, wrong value
// types or chunk hashes that are not lower-case hex.
Snapshot ParseManifest(std::string_view text);

}  // namespace rxg::snapshot
