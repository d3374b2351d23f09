#include "rxg/watcher/detector.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

#include "rxg/error.h"
#include "rxg/orchestrator/event_bus.h"
#include "rxg/watcher/entropy.h"

namespace rxg::watcher {

namespace {
constexpr std::size_t kMinTrackedStamps = 10000;
constexpr auto kSurgeWindow = std::chrono::seconds(60);

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}
}  // namespace

SurgeWindow::SurgeWindow(std::chrono::seconds window, std::size_t threshold)
    : window_(window), threshold_(threshold), max_tracked_(std::max(threshold, kMinTrackedStamps)) {}

void SurgeWindow::Record(SteadyClock::time_point now, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    if (stamps_.size() >= max_tracked_) {
      stamps_.pop_front();
    }
    stamps_.push_back(now);
  }
}

std::size_t SurgeWindow::Prune(SteadyClock::time_point now) {
  const auto cutoff = now - window_;
  while (!stamps_.empty() && stamps_.front() < cutoff) {
    stamps_.pop_front();
  }
  return stamps_.size();
}

bool SurgeWindow::Surging(SteadyClock::time_point now) {
  return threshold_ > 0 && Prune(now) >= threshold_;
}

std::string DetectionSignals::Describe() const {
  std::string out;
  auto add = [&out](const char* name) {
    if (!out.empty()) {
      out += ",";
    }
    out += name;
  };
  if (surge) {
    add("surge");
  }
  if (high_entropy) {
    add("high_entropy");
  }
  if (suspicious_extension) {
    add("suspicious_extension");
  }
  if (canary_tamper) {
    add("canary_tamper");
  }
  return out;
}

ActivityDetector::ActivityDetector(const rxg::orchestrator::Config& config, CanaryCheck canary_check)
    : surge_(kSurgeWindow, config.modification_rate_threshold_per_minute),
      entropy_threshold_(config.entropy_threshold_modified_sample),
      sample_files_(config.entropy_sample_files),
      sample_bytes_(config.entropy_sample_bytes),
      canary_check_(std::move(canary_check)) {
  suffixes_.reserve(config.suspicious_extension_suffixes.size());
  for (const auto& suffix : config.suspicious_extension_suffixes) {
    suffixes_.push_back(ToLower(suffix));
  }
}

bool ActivityDetector::IsSuspiciousExtension(const std::string& path) const {
  const auto ext = ToLower(std::filesystem::path(path).extension().string());
  if (ext.empty()) {
    return false;
  }
  return std::find(suffixes_.begin(), suffixes_.end(), ext) != suffixes_.end();
}

DetectionSignals ActivityDetector::Evaluate(const std::vector<std::string>& paths,
                                            std::size_t event_count, SteadyClock::time_point now) {
  DetectionSignals signals;

  surge_.Record(now, event_count);
  signals.surge = surge_.Surging(now);

  for (const auto& path : paths) {
    if (IsSuspiciousExtension(path)) {
      signals.suspicious_extension = true;
      break;
    }
  }

  last_max_entropy_ = 0.0;
  std::unordered_set<std::string> sampled;
  for (const auto& path : paths) {
    if (sampled.size() >= sample_files_) {
      break;
    }
    if (!sampled.insert(path).second) {
      continue;
    }
    auto entropy = SampleFileEntropy(path, sample_bytes_);
    if (!entropy) {
      continue;  // vanished or unreadable
    }
    last_max_entropy_ = std::max(last_max_entropy_, *entropy);
    if (*entropy >= entropy_threshold_) {
      signals.high_entropy = true;
    }
  }

  if (canary_check_) {
    try {
      signals.canary_tamper = canary_check_() > 0;
    } catch (const Error& err) {
      rxg::orchestrator::Event event;
      event.category = rxg::orchestrator::EventCategory::kSecurity;
      event.severity = rxg::orchestrator::EventSeverity::kWarning;
      event.event_id = "canary_check_failed";
      event.message = err.what();
      rxg::orchestrator::EventBus::Instance().Publish(event);
      signals.canary_tamper = true;
    }
  }
  return signals;
}

}  // namespace rxg::watcher
