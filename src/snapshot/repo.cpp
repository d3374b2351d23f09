#include "rxg/snapshot/repo.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <sys/stat.h>

#include "rxg/common.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/event_bus.h"
#include "rxg/orchestrator/io_util.h"

namespace rxg::snapshot {

namespace {

using rxg::orchestrator::Event;
using rxg::orchestrator::EventBus;
using rxg::orchestrator::EventCategory;
using rxg::orchestrator::EventField;
using rxg::orchestrator::EventSeverity;
using rxg::orchestrator::FieldPrivacy;

constexpr int kMaxIdDisambiguator = 999;

void PublishRepoEvent(EventSeverity severity, std::string event_id, std::string message,
                      std::vector<EventField> fields = {}) {
  Event event;
  event.category = severity >= EventSeverity::kWarning ? EventCategory::kDiagnostics
                                                       : EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

std::filesystem::path NormalizedAbsolute(const std::filesystem::path& path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  auto normal = absolute.lexically_normal();
  // "a/b/" normalizes to "a/b/" with an empty last element; drop it.
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

bool IsWithin(const std::filesystem::path& candidate, const std::filesystem::path& root) {
  auto rel = candidate.lexically_relative(root);
  if (rel.empty()) {
    return false;
  }
  auto first = *rel.begin();
  return first != "..";
}

std::filesystem::path CommonRoot(const std::vector<std::filesystem::path>& dirs) {
  if (dirs.empty()) {
    return {};
  }
  std::filesystem::path common = NormalizedAbsolute(dirs.front());
  for (size_t i = 1; i < dirs.size(); ++i) {
    auto next = NormalizedAbsolute(dirs[i]);
    std::filesystem::path shared;
    auto a = common.begin();
    auto b = next.begin();
    for (; a != common.end() && b != next.end() && *a == *b; ++a, ++b) {
      shared /= *a;
    }
    common = shared;
  }
  return common;
}

std::string FormatSnapshotId(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
  return oss.str();
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << "+00:00";
  return oss.str();
}

bool IsValidSnapshotId(std::string_view id) {
  if (id.empty()) {
    return false;
  }
  for (char c : id) {
    const bool alnum = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    if (!alnum && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

std::string ErrnoMessage(int err) {
  return std::system_category().message(err);
}

// Snapshots one file into the store. Throws on any I/O failure; the caller
// records the failure against the file.
FileEntry SnapshotFile(const std::filesystem::path& path, const storage::ChunkCodec& codec,
                       storage::ChunkStore& store, size_t chunk_size, SnapshotResult& result) {
  struct ::stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "stat failed: " + ErrnoMessage(saved_errno),
                saved_errno};
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "open failed: " + ErrnoMessage(saved_errno),
                saved_errno};
  }

  FileEntry entry;
  entry.path = PathToUtf8String(path);
  entry.size = static_cast<uint64_t>(st.st_size);
  entry.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                   static_cast<int64_t>(st.st_mtim.tv_nsec);

  std::vector<uint8_t> window(chunk_size);
  for (;;) {
    in.read(reinterpret_cast<char*>(window.data()), static_cast<std::streamsize>(window.size()));
    const auto got = static_cast<size_t>(in.gcount());
    if (got == 0) {
      if (in.bad()) {
        throw Error{ErrorDomain::IO, errors::io::kReadFailed, "read failed"};
      }
      break;
    }
    auto sealed = codec.Encrypt(std::span<const uint8_t>(window.data(), got));
    if (store.StoreChunk(sealed.hash, sealed.ciphertext)) {
      ++result.chunks_written;
    } else {
      ++result.chunks_deduplicated;
    }
    result.bytes_read += got;
    entry.chunks.push_back(std::move(sealed.hash));
    if (got < window.size()) {
      if (in.bad()) {
        throw Error{ErrorDomain::IO, errors::io::kReadFailed, "read failed"};
      }
      break;
    }
  }
  return entry;
}

void RestoreFile(const FileEntry& entry, const std::filesystem::path& out_path,
                 const storage::ChunkCodec& codec, const storage::ChunkStore& store) {
  rxg::orchestrator::EnsureDirectory(out_path.parent_path());
  auto partial = out_path;
  partial += ".rxg-partial";

  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      const int saved_errno = errno;
      throw Error{ErrorDomain::IO, errors::io::kWriteFailed,
                  "open failed: " + ErrnoMessage(saved_errno), saved_errno};
    }
    try {
      for (const auto& hash : entry.chunks) {
        auto ciphertext = store.LoadChunk(hash);
        auto plaintext = codec.Decrypt(hash, ciphertext);
        out.write(reinterpret_cast<const char*>(plaintext.data()),
                  static_cast<std::streamsize>(plaintext.size()));
        if (!out) {
          throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "write failed"};
        }
      }
      out.flush();
      if (!out) {
        throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "flush failed"};
      }
    } catch (const Error&) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(partial, ec);
      throw;
    }
  }

  std::error_code ec;
  std::filesystem::rename(partial, out_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(partial, cleanup_ec);
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "rename failed: " + ec.message(),
                ec.value()};
  }
}

}  // namespace

void RestoreResult::ThrowIfPartial() const {
  if (failures.empty()) {
    return;
  }
  throw PartialRestoreError(std::string(errors::msg::kRestorePartial) + ": " +
                                std::to_string(failures.size()) + " file(s) failed",
                            failures);
}

Repo::Repo(rxg::orchestrator::Config config, std::unique_ptr<rxg::crypto::MasterKey> master_key)
    : config_(std::move(config)),
      codec_(std::move(master_key)),
      store_(config_.chunks_dir),
      repo_root_(NormalizedAbsolute(config_.repo_dir)) {}

std::unique_ptr<Repo> Repo::Init(const rxg::orchestrator::Config& config) {
  using rxg::orchestrator::EnsureDirectory;
  EnsureDirectory(config.repo_dir);
  EnsureDirectory(config.chunks_dir);
  EnsureDirectory(config.manifest_dir);
  EnsureDirectory(config.key_file.parent_path());
  EnsureDirectory(config.canary_dir);
  EnsureDirectory(config.log_file.parent_path());
  auto key = rxg::crypto::LoadOrCreateMasterKey(config.key_file);
  PublishRepoEvent(EventSeverity::kInfo, "repo_initialized", "Repository initialized",
                   {EventField("repo", PathToUtf8String(config.repo_dir))});
  return std::make_unique<Repo>(config, std::move(key));
}

std::unique_ptr<Repo> Repo::Open(const rxg::orchestrator::Config& config) {
  auto key = rxg::crypto::LoadOrCreateMasterKey(config.key_file);
  return std::make_unique<Repo>(config, std::move(key));
}

bool Repo::IsRepoPath(const std::filesystem::path& path) const {
  return IsWithin(NormalizedAbsolute(path), repo_root_);
}

std::vector<std::filesystem::path> Repo::Scan(std::vector<FileFailure>* unreadable) const {
  std::vector<std::filesystem::path> files;
  rxg::orchestrator::TreeWalkVisitor visitor;
  visitor.enter_directory = [this](const std::filesystem::path& dir) {
    if (IsRepoPath(dir)) {
      return false;
    }
    if (scan_hooks_.before_enter_directory) {
      scan_hooks_.before_enter_directory(dir);
    }
    return true;
  };
  visitor.regular_file = [this, &files](const std::filesystem::path& path) {
    if (!IsRepoPath(path)) {
      files.push_back(NormalizedAbsolute(path));
    }
  };
  visitor.unreadable = [unreadable](const std::filesystem::path& dir, const std::error_code& ec) {
    PublishRepoEvent(EventSeverity::kWarning, "scan_directory_unreadable", ec.message(),
                     {EventField("dir", PathToUtf8String(dir), FieldPrivacy::kHash)});
    if (unreadable) {
      unreadable->push_back(FileFailure{PathToUtf8String(dir), "directory unreadable: " + ec.message()});
    }
  };
  for (const auto& dir : config_.data_dirs) {
    rxg::orchestrator::WalkTree(dir, visitor);
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

std::filesystem::path Repo::ManifestPath(std::string_view id) const {
  return config_.manifest_dir / (std::string(id) + ".json");
}

std::filesystem::path Repo::RestoreRoot() const {
  return CommonRoot(config_.data_dirs);
}

std::string Repo::AllocateSnapshotId() const {
  const std::string base = FormatSnapshotId(std::chrono::system_clock::now());
  std::error_code ec;
  if (!std::filesystem::exists(ManifestPath(base), ec)) {
    return base;
  }
  for (int n = 1; n <= kMaxIdDisambiguator; ++n) {
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "-%03d", n);
    std::string candidate = base + suffix;
    if (!std::filesystem::exists(ManifestPath(candidate), ec)) {
      return candidate;
    }
  }
  throw Error{ErrorDomain::State, 0, "Too many snapshots within one second: " + base};
}

SnapshotResult Repo::CreateSnapshot(const std::optional<std::string>& label) {
  rxg::orchestrator::EnsureDirectory(config_.manifest_dir);
  SnapshotResult result;
  const auto files = Scan(&result.skipped);
  result.snapshot.files.reserve(files.size());

  for (const auto& path : files) {
    try {
      result.snapshot.files.push_back(
          SnapshotFile(path, codec_, store_, config_.chunk_size_bytes, result));
    } catch (const Error& err) {
      result.skipped.push_back(FileFailure{PathToUtf8String(path), err.what()});
      PublishRepoEvent(EventSeverity::kWarning, "snapshot_file_skipped", err.what(),
                       {EventField("path", PathToUtf8String(path), FieldPrivacy::kHash)});
    }
  }

  const auto now = std::chrono::system_clock::now();
  result.snapshot.id = AllocateSnapshotId();
  result.snapshot.created_at = FormatIsoTimestamp(now);
  result.snapshot.version = kManifestVersion;
  result.snapshot.label = label;

  const std::string manifest = SerializeManifest(result.snapshot);
  rxg::orchestrator::AtomicReplace(ManifestPath(result.snapshot.id), AsByteSpan(manifest));

  PublishRepoEvent(EventSeverity::kInfo, "snapshot_created", "Snapshot created",
                   {EventField("snapshot", result.snapshot.id),
                    EventField("label", label.value_or("")),
                    EventField("files", std::to_string(result.snapshot.files.size()),
                               FieldPrivacy::kPublic, true),
                    EventField("skipped", std::to_string(result.skipped.size()),
                               FieldPrivacy::kPublic, true),
                    EventField("chunks_written", std::to_string(result.chunks_written),
                               FieldPrivacy::kPublic, true),
                    EventField("chunks_deduplicated", std::to_string(result.chunks_deduplicated),
                               FieldPrivacy::kPublic, true)});
  return result;
}

std::vector<std::string> Repo::ListSnapshots() const {
  std::vector<std::string> ids;
  std::error_code ec;
  if (!std::filesystem::is_directory(config_.manifest_dir, ec)) {
    return ids;
  }
  for (std::filesystem::directory_iterator it(config_.manifest_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto& path = it->path();
    if (path.extension() != ".json") {
      continue;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    ids.push_back(path.stem().string());
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<SnapshotSummary> Repo::ListSummaries() const {
  std::vector<SnapshotSummary> summaries;
  for (const auto& id : ListSnapshots()) {
    SnapshotSummary summary;
    summary.id = id;
    try {
      auto snapshot = LoadSnapshot(id);
      summary.created_at = snapshot.created_at;
      summary.label = snapshot.label;
      summary.file_count = snapshot.files.size();
    } catch (const Error& err) {
      PublishRepoEvent(EventSeverity::kWarning, "manifest_unreadable", err.what(),
                       {EventField("snapshot", id)});
    }
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

Snapshot Repo::LoadSnapshot(std::string_view id) const {
  if (!IsValidSnapshotId(id)) {
    throw NotFoundError(std::string(errors::msg::kSnapshotMissing) + ": " + std::string(id));
  }
  std::vector<uint8_t> raw;
  try {
    raw = rxg::orchestrator::ReadFileBytes(ManifestPath(id));
  } catch (const NotFoundError&) {
    throw NotFoundError(std::string(errors::msg::kSnapshotMissing) + ": " + std::string(id), ENOENT);
  }
  auto snapshot = ParseManifest(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()));
  if (snapshot.id != id) {
    throw CorruptManifestError(std::string(errors::msg::kManifestIdMismatch) + ": " + std::string(id));
  }
  return snapshot;
}

RestoreResult Repo::Restore(std::string_view id, const std::filesystem::path& dest_dir,
                            const std::vector<std::string>& path_prefixes) const {
  const auto snapshot = LoadSnapshot(id);
  rxg::orchestrator::EnsureDirectory(dest_dir);
  const auto root = RestoreRoot();
  RestoreResult result;

  for (const auto& entry : snapshot.files) {
    if (!path_prefixes.empty()) {
      const bool matches = std::any_of(path_prefixes.begin(), path_prefixes.end(),
                                       [&](const std::string& prefix) {
                                         return entry.path.compare(0, prefix.size(), prefix) == 0;
                                       });
      if (!matches) {
        continue;
      }
    }

    auto rel = std::filesystem::path(entry.path).lexically_normal().lexically_relative(root);
    if (rel.empty() || *rel.begin() == ".." || rel.is_absolute()) {
      result.failures.push_back(FileFailure{entry.path, std::string(errors::msg::kRestorePathEscape)});
      continue;
    }
    const auto out_path = dest_dir / rel;
    try {
      RestoreFile(entry, out_path, codec_, store_);
      result.restored_files.push_back(PathToUtf8String(out_path));
    } catch (const Error& err) {
      result.failures.push_back(FileFailure{entry.path, err.what()});
      PublishRepoEvent(EventSeverity::kWarning, "restore_file_failed", err.what(),
                       {EventField("path", entry.path, FieldPrivacy::kHash)});
    }
  }

  PublishRepoEvent(result.failures.empty() ? EventSeverity::kInfo : EventSeverity::kWarning,
                   "snapshot_restored", "Snapshot restored",
                   {EventField("snapshot", snapshot.id),
                    EventField("restored", std::to_string(result.restored_files.size()),
                               FieldPrivacy::kPublic, true),
                    EventField("failed", std::to_string(result.failures.size()),
                               FieldPrivacy::kPublic, true)});
  return result;
}

VerifyResult Repo::Verify(const std::optional<std::string>& id) const {
  VerifyResult result;
  std::vector<std::string> ids;
  if (id) {
    ids.push_back(*id);
  } else {
    ids = ListSnapshots();
  }
  for (const auto& snapshot_id : ids) {
    Snapshot snapshot;
    try {
      snapshot = LoadSnapshot(snapshot_id);
    } catch (const Error& err) {
      ++result.unreadable_manifests;
      PublishRepoEvent(EventSeverity::kWarning, "verify_manifest_unreadable", err.what(),
                       {EventField("snapshot", snapshot_id)});
      continue;
    }
    result.file_count += snapshot.files.size();
    for (const auto& entry : snapshot.files) {
      for (const auto& hash : entry.chunks) {
        bool present = false;
        try {
          present = store_.HasChunk(hash);
        } catch (const Error&) {
          present = false;  // unaddressable hash
        }
        if (!present) {
          ++result.missing_chunks;
        }
      }
    }
  }
  return result;
}

}  // namespace rxg::snapshot
