#include "rxg/watcher/activity_watcher.h"

#include <exception>
#include <string>
#include <vector>

#include "rxg/orchestrator/event_bus.h"

namespace rxg::watcher {

namespace {

using rxg::orchestrator::Event;
using rxg::orchestrator::EventBus;
using rxg::orchestrator::EventCategory;
using rxg::orchestrator::EventField;
using rxg::orchestrator::EventSeverity;
using rxg::orchestrator::FieldPrivacy;

std::vector<std::string> CollectPaths(const std::vector<ChangeEvent>& batch) {
  std::vector<std::string> paths;
  paths.reserve(batch.size());
  for (const auto& event : batch) {
    if (!event.path.empty()) {
      paths.push_back(event.path);
    }
    if (!event.dest_path.empty()) {
      paths.push_back(event.dest_path);
    }
  }
  return paths;
}

}  // namespace

ActivityWatcher::ActivityWatcher(const rxg::orchestrator::Config& config, snapshot::Repo& repo,
                                 canary::CanaryManager& canaries, std::unique_ptr<ChangeSource> source,
                                 OverflowPolicy policy)
    : config_(config),
      repo_(repo),
      source_(std::move(source)),
      queue_(config.event_queue_capacity, policy),
      detector_(config, [&canaries]() { return canaries.Check(); }) {}

ActivityWatcher::~ActivityWatcher() {
  Teardown();
}

void ActivityWatcher::Start() {
  std::lock_guard<std::mutex> guard(state_mutex_);
  if (started_ || !source_) {
    return;
  }
  source_->Start([this](ChangeEvent event) {
    if (IsOwnWrite(event)) {
      return;
    }
    queue_.Push(std::move(event));
  });
  started_ = true;
}

bool ActivityWatcher::RunOnce() {
  auto batch = queue_.DrainBatch(config_.event_batch_size, drain_timeout_);
  const auto dropped = queue_.Dropped();
  if (dropped != reported_drops_) {
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kWarning;
    event.event_id = "watch_backpressure";
    event.message = "Event queue full; oldest events dropped";
    event.fields.emplace_back("dropped_total", std::to_string(dropped), FieldPrivacy::kPublic, true);
    EventBus::Instance().Publish(event);
    reported_drops_ = dropped;
  }
  if (batch.empty()) {
    return false;
  }

  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    ++stats_.cycles;
    stats_.events += batch.size();
  }

  DetectionSignals signals;
  try {
    signals = detector_.Evaluate(CollectPaths(batch), batch.size(), SteadyClock::now());
  } catch (const std::exception& ex) {
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kError;
    event.event_id = "detection_cycle_failed";
    event.message = ex.what();
    EventBus::Instance().Publish(event);
    return false;
  }

  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    last_signals_ = signals;
  }
  if (!signals.Any()) {
    return false;
  }
  Respond(signals, batch.size());
  return true;
}

void ActivityWatcher::Respond(const DetectionSignals& signals, std::size_t batch_size) {
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    ++stats_.alerts;
  }

  Event alert;
  alert.category = EventCategory::kSecurity;
  alert.severity = EventSeverity::kCritical;
  alert.event_id = "suspicious_activity";
  alert.message = "Suspicious activity detected";
  alert.fields.emplace_back("signals", signals.Describe());
  alert.fields.emplace_back("batch_events", std::to_string(batch_size), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(alert);

  try {
    repo_.CreateSnapshot(std::string(kAlertSnapshotLabel));
    std::lock_guard<std::mutex> guard(state_mutex_);
    ++stats_.snapshots;
  } catch (const std::exception& ex) {
    {
      std::lock_guard<std::mutex> guard(state_mutex_);
      ++stats_.snapshot_failures;
    }
    Event failure;
    failure.category = EventCategory::kSecurity;
    failure.severity = EventSeverity::kError;
    failure.event_id = "containment_snapshot_failed";
    failure.message = ex.what();
    EventBus::Instance().Publish(failure);
  }

  Cooldown();
}

void ActivityWatcher::Cooldown() {
  const auto cooldown = std::chrono::seconds(config_.alert_cooldown_seconds);
  if (cooldown.count() == 0) {
    return;
  }
  std::unique_lock<std::mutex> lock(state_mutex_);
  stop_cv_.wait_for(lock, cooldown, [this] { return stop_requested_.load(); });
}

void ActivityWatcher::Run() {
  Start();
  while (!stop_requested_.load()) {
    RunOnce();
  }
  Teardown();
}

void ActivityWatcher::Stop() {
  stop_requested_.store(true);
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
  }
  stop_cv_.notify_all();
  queue_.Close();
}

bool ActivityWatcher::IsOwnWrite(const ChangeEvent& event) const {
  const bool source_inside = event.path.empty() || repo_.IsRepoPath(event.path);
  const bool dest_inside = event.dest_path.empty() || repo_.IsRepoPath(event.dest_path);
  return source_inside && dest_inside;
}

void ActivityWatcher::Teardown() {
  // a producer blocked on a full queue must return before the source stops
  queue_.Close();
  std::lock_guard<std::mutex> guard(state_mutex_);
  if (started_ && source_) {
    source_->Stop();
    started_ = false;
  }
}

WatcherStats ActivityWatcher::Stats() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return stats_;
}

std::optional<DetectionSignals> ActivityWatcher::LastSignals() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return last_signals_;
}

}  // namespace rxg::watcher
