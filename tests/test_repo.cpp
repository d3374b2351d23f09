#include "rxg/snapshot/repo.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "rxg/common.h"
#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/orchestrator/config.h"
#include "rxg/orchestrator/event_bus.h"

namespace {

class TempDir {
public:
  TempDir() {
    std::array<uint8_t, 8> token{};
    rxg::crypto::SystemRandomBytes(token);
    path_ = std::filesystem::temp_directory_path() / ("rxg_repo_" + rxg::HexEncode(token));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

std::vector<uint8_t> Pattern(size_t size, uint32_t seed) {
  std::vector<uint8_t> data(size);
  uint32_t state = seed;
  for (auto& byte : data) {
    state = state * 1664525u + 1013904223u;
    byte = static_cast<uint8_t>(state >> 24);
  }
  return data;
}

void WriteFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

const rxg::snapshot::FileEntry* FindEntry(const rxg::snapshot::Snapshot& snapshot,
                                          const std::filesystem::path& path) {
  const auto wanted = rxg::PathToUtf8String(path);
  for (const auto& entry : snapshot.files) {
    if (entry.path == wanted) {
      return &entry;
    }
  }
  return nullptr;
}

struct Fixture {
  TempDir tmp;
  std::filesystem::path data;
  std::filesystem::path repo_dir;
  std::vector<uint8_t> small = Pattern(1024, 1);
  std::vector<uint8_t> big = Pattern(5 * 1024 * 1024, 2);
  std::vector<uint8_t> nested = Pattern(300, 3);

  Fixture() : data(tmp.path() / "data"), repo_dir(tmp.path() / "repo") {
    WriteFile(data / "a.txt", small);
    WriteFile(data / "big.bin", big);
    WriteFile(data / "empty.dat", {});
    WriteFile(data / "sub" / "c.txt", nested);
  }

  rxg::orchestrator::Config MakeConfig() const { return rxg::orchestrator::Config::Default(repo_dir, {data}); }
};

void TestSnapshotRestoreVerify() {
  Fixture fx;
  auto repo = rxg::snapshot::Repo::Init(fx.MakeConfig());

  auto files = repo->Scan();
  assert(files.size() == 4);
  assert(std::is_sorted(files.begin(), files.end()));

  auto result = repo->CreateSnapshot(std::string("nightly"));
  const auto& snapshot = result.snapshot;
  assert(snapshot.files.size() == 4);
  assert(result.skipped.empty());
  assert(snapshot.label && *snapshot.label == "nightly");
  assert(snapshot.version == 1);
  assert(snapshot.created_at.size() > 6 &&
         snapshot.created_at.compare(snapshot.created_at.size() - 6, 6, "+00:00") == 0);

  const auto* big = FindEntry(snapshot, fx.data / "big.bin");
  assert(big != nullptr);
  assert(big->size == fx.big.size());
  assert(big->chunks.size() == 2 && "5 MiB splits into a 4 MiB and a 1 MiB window");
  const auto* empty = FindEntry(snapshot, fx.data / "empty.dat");
  assert(empty != nullptr && empty->size == 0 && empty->chunks.empty());
  assert(FindEntry(snapshot, fx.data / "a.txt")->chunks.size() == 1);
  assert(result.chunks_written == 4);
  assert(result.bytes_read == fx.small.size() + fx.big.size() + fx.nested.size());

  auto ids = repo->ListSnapshots();
  assert(ids.size() == 1 && ids[0] == snapshot.id);
  auto loaded = repo->LoadSnapshot(snapshot.id);
  assert(loaded.files.size() == snapshot.files.size());

  const auto dest = fx.tmp.path() / "restore";
  auto restored = repo->Restore(snapshot.id, dest);
  assert(restored.Complete());
  assert(restored.restored_files.size() == 4);
  assert(ReadFile(dest / "a.txt") == fx.small);
  assert(ReadFile(dest / "big.bin") == fx.big);
  assert(ReadFile(dest / "sub" / "c.txt") == fx.nested);
  assert(std::filesystem::exists(dest / "empty.dat"));
  assert(std::filesystem::file_size(dest / "empty.dat") == 0);

  auto verify = repo->Verify();
  assert(verify.file_count == 4 && verify.missing_chunks == 0 && verify.unreadable_manifests == 0);

  // unchanged data deduplicates fully; ids stay unique and ordered
  auto second = repo->CreateSnapshot();
  assert(second.chunks_written == 0);
  assert(second.chunks_deduplicated == 4);
  assert(second.snapshot.id != snapshot.id);
  assert(!second.snapshot.label.has_value());
  auto third = repo->CreateSnapshot();
  ids = repo->ListSnapshots();
  assert(ids.size() == 3);
  assert(ids[0] == snapshot.id && ids[1] == second.snapshot.id && ids[2] == third.snapshot.id);

  // remove one chunk of the big file
  std::filesystem::remove(repo->Store().ChunkPath(big->chunks[1]));
  verify = repo->Verify(snapshot.id);
  assert(verify.file_count == 4 && verify.missing_chunks >= 1);

  const auto partial_dest = fx.tmp.path() / "partial";
  auto partial = repo->Restore(snapshot.id, partial_dest);
  assert(!partial.Complete());
  assert(partial.failures.size() == 1);
  assert(partial.failures[0].path == big->path);
  assert(partial.restored_files.size() == 3);
  assert(!std::filesystem::exists(partial_dest / "big.bin"));
  bool threw = false;
  try {
    partial.ThrowIfPartial();
  } catch (const rxg::PartialRestoreError& err) {
    threw = err.failures.size() == 1;
  }
  assert(threw);
}

void TestPrefixFilter() {
  Fixture fx;
  auto repo = rxg::snapshot::Repo::Init(fx.MakeConfig());
  auto id = repo->CreateSnapshot().snapshot.id;

  const auto dest = fx.tmp.path() / "only_sub";
  auto restored = repo->Restore(id, dest, {rxg::PathToUtf8String(fx.data / "sub")});
  assert(restored.Complete());
  assert(restored.restored_files.size() == 1);
  assert(ReadFile(dest / "sub" / "c.txt") == fx.nested);
  assert(!std::filesystem::exists(dest / "a.txt"));

  auto none = repo->Restore(id, fx.tmp.path() / "none", {"/nonexistent/prefix"});
  assert(none.Complete() && none.restored_files.empty());
}

void TestMissingAndCorruptManifests() {
  Fixture fx;
  auto config = fx.MakeConfig();
  auto repo = rxg::snapshot::Repo::Init(config);
  auto id = repo->CreateSnapshot().snapshot.id;

  bool not_found = false;
  try {
    (void)repo->LoadSnapshot("20000101T000000Z");
  } catch (const rxg::NotFoundError&) {
    not_found = true;
  }
  assert(not_found);

  not_found = false;
  try {
    (void)repo->LoadSnapshot("../config");
  } catch (const rxg::NotFoundError&) {
    not_found = true;
  }
  assert(not_found && "ids never address files outside the manifest directory");

  not_found = false;
  try {
    (void)repo->Restore("20000101T000000Z", fx.tmp.path() / "nowhere");
  } catch (const rxg::NotFoundError&) {
    not_found = true;
  }
  assert(not_found);

  {
    std::ofstream broken(config.manifest_dir / "20990101T000000Z.json", std::ios::trunc);
    broken << "{ this is not json";
  }
  bool corrupt = false;
  try {
    (void)repo->LoadSnapshot("20990101T000000Z");
  } catch (const rxg::CorruptManifestError&) {
    corrupt = true;
  }
  assert(corrupt);

  std::filesystem::copy_file(config.manifest_dir / (id + ".json"), config.manifest_dir / "renamed.json");
  corrupt = false;
  try {
    (void)repo->LoadSnapshot("renamed");
  } catch (const rxg::CorruptManifestError&) {
    corrupt = true;
  }
  assert(corrupt && "manifest id must match its file name");

  auto verify = repo->Verify();
  assert(verify.unreadable_manifests == 2);
  assert(verify.file_count == 4 && verify.missing_chunks == 0);

  auto summaries = repo->ListSummaries();
  assert(summaries.size() == 3);
}

void TestNestedRepositoryIsExcluded() {
  TempDir tmp;
  const auto data = tmp.path() / "data";
  WriteFile(data / "report.txt", Pattern(100, 7));
  auto config = rxg::orchestrator::Config::Default(data / ".rxguard", {data});
  auto repo = rxg::snapshot::Repo::Init(config);
  auto first = repo->CreateSnapshot();
  assert(first.snapshot.files.size() == 1);
  auto second = repo->CreateSnapshot();
  assert(second.snapshot.files.size() == 1 && "chunks and manifests are never snapshotted");
}

void TestOpenRejectsBadKey() {
  Fixture fx;
  auto config = fx.MakeConfig();
  (void)rxg::snapshot::Repo::Init(config);
  {
    std::ofstream truncate(config.key_file, std::ios::binary | std::ios::trunc);
    truncate << "short";
  }
  bool rejected = false;
  try {
    (void)rxg::snapshot::Repo::Open(config);
  } catch (const rxg::KeyError&) {
    rejected = true;
  }
  assert(rejected);
}

}  // namespace

void TestDuplicateFilesShareChunks() {
  TempDir tmp;
  const auto data = tmp.path() / "data";
  const auto shared = Pattern(2048, 7);
  WriteFile(data / "copy1.txt", shared);
  WriteFile(data / "nested" / "copy2.txt", shared);
  WriteFile(data / "other.txt", Pattern(2048, 8));
  auto config = rxg::orchestrator::Config::Default(tmp.path() / "repo", {data});
  auto repo = rxg::snapshot::Repo::Init(config);

  auto result = repo->CreateSnapshot();
  const auto* first = FindEntry(result.snapshot, data / "copy1.txt");
  const auto* second = FindEntry(result.snapshot, data / "nested" / "copy2.txt");
  assert(first != nullptr && second != nullptr);
  assert(first->chunks == second->chunks);
  assert(result.chunks_written == 2 && result.chunks_deduplicated == 1);

  std::size_t stored = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(config.chunks_dir)) {
    if (entry.is_regular_file()) {
      ++stored;
    }
  }
  assert(stored == 2 && "identical content is stored once");
}

void TestVanishedEntriesAreSkipped() {
  TempDir tmp;
  const auto first = tmp.path() / "first";
  const auto second = tmp.path() / "second";
  WriteFile(first / "keep.txt", Pattern(100, 1));
  WriteFile(first / "victim.txt", Pattern(100, 2));
  WriteFile(second / "keep2.txt", Pattern(100, 3));
  WriteFile(second / "doomed" / "lost.txt", Pattern(100, 4));
  WriteFile(second / "doomed" / "deeper" / "lost2.txt", Pattern(100, 5));
  auto repo = rxg::snapshot::Repo::Init(
      rxg::orchestrator::Config::Default(tmp.path() / "repo", {first, second}));

  // "first" is fully listed before "second" is walked. Entering
  // second/doomed removes it along with an already listed file.
  rxg::snapshot::ScanHooks hooks;
  hooks.before_enter_directory = [&](const std::filesystem::path& dir) {
    if (dir.filename() == "doomed") {
      std::filesystem::remove_all(dir);
      std::filesystem::remove(first / "victim.txt");
    }
  };
  repo->SetScanHooks(hooks);

  auto result = repo->CreateSnapshot();
  assert(result.snapshot.files.size() == 2);
  assert(FindEntry(result.snapshot, first / "keep.txt") != nullptr);
  assert(FindEntry(result.snapshot, second / "keep2.txt") != nullptr);

  assert(result.skipped.size() == 2);
  bool directory_recorded = false;
  bool file_recorded = false;
  for (const auto& failure : result.skipped) {
    directory_recorded |= failure.path == rxg::PathToUtf8String(second / "doomed");
    file_recorded |= failure.path == rxg::PathToUtf8String(first / "victim.txt");
    assert(!failure.message.empty());
  }
  assert(directory_recorded && file_recorded);

  // the partial snapshot is persisted like any other
  auto loaded = repo->LoadSnapshot(result.snapshot.id);
  assert(loaded.files.size() == 2);
}

int main() {
  TestSnapshotRestoreVerify();
  TestDuplicateFilesShareChunks();
  TestVanishedEntriesAreSkipped();
  TestPrefixFilter();
  TestMissingAndCorruptManifests();
  TestNestedRepositoryIsExcluded();
  TestOpenRejectsBadKey();
  rxg::orchestrator::ResetEventBusForTesting();
  std::cout << "repo tests ok\n";
  return 0;
}
