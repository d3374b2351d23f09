#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rxg/error.h"
#include "rxg/orchestrator/config.h"
#include "rxg/snapshot/manifest.h"
#include "rxg/storage/chunk_codec.h"
#include "rxg/storage/chunk_store.h"

namespace rxg::snapshot {

struct SnapshotResult {
  Snapshot snapshot;
  std::vector<FileFailure> skipped;  // files left out of the manifest
  uint64_t chunks_written{0};
  uint64_t chunks_deduplicated{0};
  uint64_t bytes_read{0};
};

struct RestoreResult {
  std::vector<std::string> restored_files;  // destination paths
  std::vector<FileFailure> failures;        // keyed by manifest path

  bool Complete() const { return failures.empty(); }
  // Raises PartialRestoreError carrying |failures| when any file failed.
  void ThrowIfPartial() const;
};

struct VerifyResult {
  std::size_t file_count{0};
  std::size_t missing_chunks{0};
  std::size_t unreadable_manifests{0};
};

struct ScanHooks { // test seam for directories changing under the scan
  std::function<void(const std::filesystem::path&)> before_enter_directory;
};

struct SnapshotSummary {
  std::string id;
  std::string created_at;
  std::optional<std::string> label;
  std::size_t file_count{0};
};

// Owns the chunk codec (and with it the master key) plus the chunk store of
// one repository. Instances are independent; nothing is process-global.
class Repo {
public:
  Repo(rxg::orchestrator::Config config, std::unique_ptr<rxg::crypto::MasterKey> master_key);

  // Creates the repository layout and bootstraps the master key.
  static std::unique_ptr<Repo> Init(const rxg::orchestrator::Config& config);
  // Opens an existing repository. Throws KeyError for an invalid key file.
  static std::unique_ptr<Repo> Open(const rxg::orchestrator::Config& config);

  // Every regular file below the data directories, sorted, excluding the
  // repository itself when it is nested in a data directory. Directories that
  // cannot be read are skipped and, when |unreadable| is given, recorded there.
  std::vector<std::filesystem::path> Scan(std::vector<FileFailure>* unreadable = nullptr) const;

  void SetScanHooks(ScanHooks hooks) { scan_hooks_ = std::move(hooks); }

  // True for paths inside the repository directory.
  bool IsRepoPath(const std::filesystem::path& path) const;

  SnapshotResult CreateSnapshot(const std::optional<std::string>& label = std::nullopt);

  // Snapshot ids in chronological order.
  std::vector<std::string> ListSnapshots() const;
  std::vector<SnapshotSummary> ListSummaries() const;

  // Throws NotFoundError or CorruptManifestError.
  Snapshot LoadSnapshot(std::string_view id) const;

  // Rebuilds the matching files under |dest_dir| relative to the common root
  // of the data directories. An empty |path_prefixes| restores everything.
  // Per-file failures are collected, never thrown.
  RestoreResult Restore(std::string_view id, const std::filesystem::path& dest_dir,
                        const std::vector<std::string>& path_prefixes = {}) const;

  // Presence check of every referenced chunk; does not decrypt. Never throws
  // for repository content problems.
  VerifyResult Verify(const std::optional<std::string>& id = std::nullopt) const;

  const rxg::orchestrator::Config& GetConfig() const { return config_; }
  const storage::ChunkCodec& Codec() const { return codec_; }
  storage::ChunkStore& Store() { return store_; }
  const storage::ChunkStore& Store() const { return store_; }

  std::filesystem::path ManifestPath(std::string_view id) const;
  std::filesystem::path RestoreRoot() const;

private:
  std::string AllocateSnapshotId() const;

  rxg::orchestrator::Config config_;
  storage::ChunkCodec codec_;
  storage::ChunkStore store_;
  std::filesystem::path repo_root_;
  ScanHooks scan_hooks_;
};

}  // namespace rxg::snapshot
