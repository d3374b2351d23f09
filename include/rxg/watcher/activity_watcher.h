#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "rxg/canary/canary_manager.h"
#include "rxg/orchestrator/config.h"
#include "rxg/snapshot/repo.h"
#include "rxg/watcher/change_source.h"
#include "rxg/watcher/detector.h"
#include "rxg/watcher/event_queue.h"

namespace rxg::watcher {

inline constexpr const char* kAlertSnapshotLabel = "auto-alert";

struct WatcherStats {
  uint64_t cycles{0};
  uint64_t events{0};
  uint64_t alerts{0};
  uint64_t snapshots{0};
  uint64_t snapshot_failures{0};
};

// Single-consumer detection loop. The change source feeds a bounded queue;
// each cycle drains a batch, evaluates the detector and, on alert, takes a
// containment snapshot followed by a cooldown. Events that arrive during the
// snapshot or the cooldown wait in the queue.
class ActivityWatcher {
public:
  ActivityWatcher(const rxg::orchestrator::Config& config, snapshot::Repo& repo,
                  canary::CanaryManager& canaries, std::unique_ptr<ChangeSource> source,
                  OverflowPolicy policy = OverflowPolicy::kDropOldest);
  ~ActivityWatcher();

  ActivityWatcher(const ActivityWatcher&) = delete;
  ActivityWatcher& operator=(const ActivityWatcher&) = delete;

  // Connects the change source to the queue.
  void Start();

  // One drain/detect/respond cycle. Returns true when an alert fired.
  bool RunOnce();

  // Start() then RunOnce() until Stop(); tears the source down on exit.
  void Run();

  // Thread-safe. Interrupts a cooldown; the loop exits between cycles.
  void Stop();

  bool StopRequested() const { return stop_requested_.load(); }
  BoundedEventQueue<ChangeEvent>& Queue() { return queue_; }
  WatcherStats Stats() const;
  std::optional<DetectionSignals> LastSignals() const;

private:
  void Respond(const DetectionSignals& signals, std::size_t batch_size);
  void Cooldown();
  void Teardown();
  // Chunk and manifest writes of the repository itself.
  bool IsOwnWrite(const ChangeEvent& event) const;

  rxg::orchestrator::Config config_;
  snapshot::Repo& repo_;
  std::unique_ptr<ChangeSource> source_;
  BoundedEventQueue<ChangeEvent> queue_;
  ActivityDetector detector_;
  std::chrono::milliseconds drain_timeout_{std::chrono::seconds(1)};

  std::atomic<bool> stop_requested_{false};
  bool started_{false};
  mutable std::mutex state_mutex_;
  std::condition_variable stop_cv_;
  WatcherStats stats_;
  std::optional<DetectionSignals> last_signals_;
  uint64_t reported_drops_{0};
};

}  // namespace rxg::watcher
