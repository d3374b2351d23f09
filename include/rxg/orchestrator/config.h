#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "rxg/error.h"

namespace rxg::orchestrator {

inline constexpr std::size_t kDefaultChunkSizeBytes = 4 * 1024 * 1024;
inline constexpr uint32_t kDefaultModificationRateThreshold = 200;
inline constexpr double kDefaultEntropyThreshold = 6.5;

// Repository layout plus detection and watcher tuning. Persisted as JSON.
struct Config {
  std::filesystem::path repo_dir;
  std::vector<std::filesystem::path> data_dirs;
  std::filesystem::path key_file;
  std::filesystem::path manifest_dir;
  std::filesystem::path chunks_dir;
  std::filesystem::path canary_dir;
  std::filesystem::path log_file;

  std::size_t chunk_size_bytes{kDefaultChunkSizeBytes};
  uint32_t modification_rate_threshold_per_minute{kDefaultModificationRateThreshold};
  double entropy_threshold_modified_sample{kDefaultEntropyThreshold};
  std::vector<std::string> suspicious_extension_suffixes{".locked", ".crypt", ".crypto",
                                                         ".encrypted", ".enc"};

  uint32_t alert_cooldown_seconds{5};
  std::size_t event_batch_size{100};
  std::size_t entropy_sample_files{20};
  std::size_t entropy_sample_bytes{4096};
  std::size_t event_queue_capacity{10000};
  std::size_t canaries_per_directory{3};

  // Derives every repository path from |repo_dir|.
  static Config Default(const std::filesystem::path& repo_dir,
                        std::vector<std::filesystem::path> data_dirs);

  // Throws Error{Config} on malformed JSON or a missing required key,
  // NotFoundError when |path| does not exist.
  static Config Load(const std::filesystem::path& path);

  void Save(const std::filesystem::path& path) const;
  void Validate() const;

  std::filesystem::path ConfigPath() const { return repo_dir / "config.json"; }
};

// RXG_CONFIG when set, otherwise config.json in the working directory.
std::filesystem::path DefaultConfigPath();

}  // namespace rxg::orchestrator
