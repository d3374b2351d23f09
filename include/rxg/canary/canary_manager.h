#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "rxg/orchestrator/config.h"

namespace rxg::canary {

inline constexpr std::size_t kCanaryContentBytes = 2048;
inline constexpr const char* kCanaryMetadataFile = "canaries.json";

struct Canary {
  std::string path;
  std::string hash;  // content hash at deployment time
};

struct CanaryReport {
  std::size_t total{0};
  std::vector<std::string> tampered;  // missing, unreadable or changed
};

// Plants decoy files in every data directory and detects their modification.
// The tracked set lives in <canary_dir>/canaries.json and is replaced on each
// deployment.
class CanaryManager {
public:
  explicit CanaryManager(const rxg::orchestrator::Config& config);

  std::vector<Canary> Deploy(std::size_t per_directory);

  // Number of tampered canaries.
  std::size_t Check() const;
  CanaryReport Inspect() const;

  // Throws Error{Validation} when the metadata file is malformed. A missing
  // file means no canaries have been deployed.
  std::vector<Canary> Tracked() const;

  const std::filesystem::path& MetadataPath() const { return metadata_path_; }

private:
  void SaveMetadata(const std::vector<Canary>& canaries) const;

  std::vector<std::filesystem::path> data_dirs_;
  std::filesystem::path metadata_path_;
};

}  // namespace rxg::canary
