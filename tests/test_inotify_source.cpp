#include "rxg/watcher/change_source.h"

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rxg/common.h"
#include "rxg/crypto/random.h"
#include "rxg/orchestrator/event_bus.h"

namespace {

using rxg::watcher::ChangeEvent;
using rxg::watcher::ChangeKind;

class TempDir {
public:
  TempDir() {
    std::array<uint8_t, 8> token{};
    rxg::crypto::SystemRandomBytes(token);
    path_ = std::filesystem::temp_directory_path() / ("rxg_inotify_" + rxg::HexEncode(token));
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

class Recorder {
public:
  rxg::watcher::ChangeSource::Sink Sink() {
    return [this](ChangeEvent event) {
      std::lock_guard<std::mutex> guard(mutex_);
      events_.push_back(std::move(event));
    };
  }

  std::vector<ChangeEvent> Events() {
    std::lock_guard<std::mutex> guard(mutex_);
    return events_;
  }

  // Polls until |done| holds for the recorded events or five seconds pass.
  bool WaitFor(const std::function<bool(const std::vector<ChangeEvent>&)>& done) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (done(Events())) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

private:
  std::mutex mutex_;
  std::vector<ChangeEvent> events_;
};

std::size_t CountKind(const std::vector<ChangeEvent>& events, ChangeKind kind) {
  std::size_t count = 0;
  for (const auto& event : events) {
    if (event.kind == kind) {
      ++count;
    }
  }
  return count;
}

void TestEachWriteIsOneCreateAndOneModify() {
  TempDir tmp;
  Recorder recorder;
  rxg::watcher::InotifySource source({tmp.path()});
  source.Start(recorder.Sink());

  constexpr std::size_t kFiles = 10;
  for (std::size_t i = 0; i < kFiles; ++i) {
    std::ofstream(tmp.path() / ("note" + std::to_string(i) + ".txt")) << "payload\n";
  }
  assert(recorder.WaitFor([](const auto& events) { return events.size() >= 2 * kFiles; }));
  // late duplicates would show up here
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  source.Stop();

  auto events = recorder.Events();
  assert(events.size() == 2 * kFiles);
  assert(CountKind(events, ChangeKind::kCreated) == kFiles);
  assert(CountKind(events, ChangeKind::kModified) == kFiles);
  assert(CountKind(events, ChangeKind::kMoved) == 0);
}

void TestRenameIsPairedIntoOneMove() {
  TempDir tmp;
  const auto original = tmp.path() / "scan.dcm";
  std::ofstream(original) << "image";
  Recorder recorder;
  rxg::watcher::InotifySource source({tmp.path()});
  source.Start(recorder.Sink());

  auto locked = original;
  locked += ".locked";
  std::filesystem::rename(original, locked);
  assert(recorder.WaitFor([](const auto& events) { return !events.empty(); }));
  source.Stop();

  auto events = recorder.Events();
  assert(events.size() == 1 && events[0].kind == ChangeKind::kMoved);
  assert(events[0].path == rxg::PathToUtf8String(original));
  assert(events[0].dest_path == rxg::PathToUtf8String(locked));
}

void TestExcludedTreeIsNotWatched() {
  TempDir tmp;
  const auto repo = tmp.path() / "rxguard-repo";
  std::filesystem::create_directories(repo / "chunks" / "ab");
  Recorder recorder;
  rxg::watcher::InotifySource source({tmp.path()}, {repo});
  source.Start(recorder.Sink());

  std::ofstream(repo / "chunks" / "ab" / "ab01.bin") << "sealed";
  std::ofstream(repo / "manifest.json") << "{}";
  const auto marker = tmp.path() / "marker.txt";
  std::ofstream(marker) << "seen";
  const auto marker_utf8 = rxg::PathToUtf8String(marker);
  assert(recorder.WaitFor([&marker_utf8](const auto& events) {
    return CountKind(events, ChangeKind::kModified) > 0 && events.back().path == marker_utf8;
  }));
  source.Stop();

  for (const auto& event : recorder.Events()) {
    assert(event.path == marker_utf8 && "nothing below the excluded directory is reported");
  }
}

}  // namespace

int main() {
  TestEachWriteIsOneCreateAndOneModify();
  TestRenameIsPairedIntoOneMove();
  TestExcludedTreeIsNotWatched();
  rxg::orchestrator::ResetEventBusForTesting();
  std::cout << "inotify source tests ok\n";
  return 0;
}
