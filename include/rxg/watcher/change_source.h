#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rxg::watcher {

enum class ChangeKind { kCreated, kModified, kMoved };

struct ChangeEvent {
  ChangeKind kind{ChangeKind::kModified};
  std::string path;
  std::string dest_path;  // set for kMoved only
};

// Producer of file change notifications. Directory events are never reported.
class ChangeSource {
public:
  using Sink = std::function<void(ChangeEvent)>;

  virtual ~ChangeSource() = default;

  // Begins delivering events to |sink| from a background thread.
  virtual void Start(Sink sink) = 0;
  // Stops delivery. Must be safe to call more than once.
  virtual void Stop() = 0;
};

// inotify-backed source watching every directory below the roots, including
// directories created later. Nothing inside |excluded| is watched.
class InotifySource final : public ChangeSource {
public:
  explicit InotifySource(std::vector<std::filesystem::path> roots,
                         std::vector<std::filesystem::path> excluded = {},
                         std::chrono::milliseconds stop_timeout = std::chrono::seconds(5));
  ~InotifySource() override;

  InotifySource(const InotifySource&) = delete;
  InotifySource& operator=(const InotifySource&) = delete;

  void Start(Sink sink) override;
  // Signals the reader thread and joins it, detaching after |stop_timeout|.
  void Stop() override;

  struct State;

private:
  std::vector<std::filesystem::path> roots_;
  std::vector<std::filesystem::path> excluded_;
  std::chrono::milliseconds stop_timeout_;
  std::shared_ptr<State> state_;
  std::thread reader_;
};

}  // namespace rxg::watcher
