#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "rxg/orchestrator/config.h"

namespace rxg::watcher {

using SteadyClock = std::chrono::steady_clock;

// Counts events inside a trailing time window. Timestamps are supplied by the
// caller and must be non-decreasing.
class SurgeWindow {
public:
  SurgeWindow(std::chrono::seconds window, std::size_t threshold);

  void Record(SteadyClock::time_point now, std::size_t count = 1);
  // Drops entries older than the window and returns how many remain.
  std::size_t Prune(SteadyClock::time_point now);
  bool Surging(SteadyClock::time_point now);

  std::size_t Threshold() const { return threshold_; }

private:
  std::chrono::seconds window_;
  std::size_t threshold_;
  std::size_t max_tracked_;
  std::deque<SteadyClock::time_point> stamps_;
};

struct DetectionSignals {
  bool surge{false};
  bool high_entropy{false};
  bool suspicious_extension{false};
  bool canary_tamper{false};

  bool Any() const { return surge || high_entropy || suspicious_extension || canary_tamper; }
  // Comma separated names of the signals that fired.
  std::string Describe() const;
};

// Applies the four detection heuristics to one batch of changed paths. Any
// single signal is sufficient for an alert.
class ActivityDetector {
public:
  using CanaryCheck = std::function<std::size_t()>;

  ActivityDetector(const rxg::orchestrator::Config& config, CanaryCheck canary_check);

  DetectionSignals Evaluate(const std::vector<std::string>& paths, std::size_t event_count,
                            SteadyClock::time_point now);

  bool IsSuspiciousExtension(const std::string& path) const;

  // Highest entropy observed in the last evaluation, 0 when nothing was sampled.
  double LastMaxEntropy() const { return last_max_entropy_; }

private:
  SurgeWindow surge_;
  double entropy_threshold_;
  std::size_t sample_files_;
  std::size_t sample_bytes_;
  std::vector<std::string> suffixes_;
  CanaryCheck canary_check_;
  double last_max_entropy_{0.0};
};

}  // namespace rxg::watcher
