#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rxg::orchestrator {

// Structured logging primitives
enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

enum class FieldPrivacy { kPublic, kRedact, kHash };

struct EventField {
  std::string key;
  std::string value;
  FieldPrivacy privacy{FieldPrivacy::kPublic};
  bool numeric{false};

  EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
             bool is_numeric = false)
      : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
};

struct Event {
  EventCategory category{EventCategory::kDiagnostics};
  EventSeverity severity{EventSeverity::kInfo};
  std::string event_id;
  std::string message;
  std::vector<EventField> fields;
};

// SHA-256 hex digest used for kHash fields.
std::string HashForTelemetry(std::string_view input);

// Serializes one event as a single JSON object without a trailing newline.
std::string FormatEventJson(const Event& event, const std::string& timestamp);

const char* SeverityToString(EventSeverity severity);
const char* CategoryToString(EventCategory category);

class JsonLineLogger {
public:
  // Appends to |log_path|, rotating into log_path.1 .. log_path.3 once the
  // file would exceed RXG_LOG_MAX_SIZE bytes (10 MiB when unset).
  explicit JsonLineLogger(std::filesystem::path log_path);
  void Log(const Event& event);
  const std::filesystem::path& Path() const { return log_path_; }

private:
  std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
  void EnsureOpen();
  void RotateIfNeeded(size_t incoming_bytes);
  size_t ResolveMaxBytes() const;

  std::mutex mutex_;
  std::ofstream stream_;
  std::filesystem::path log_path_;
  size_t max_bytes_;
  const size_t max_files_ = 3;
};

// Writes warnings and above to std::clog; info too when RXG_VERBOSE is set.
class ConsoleSink {
public:
  ConsoleSink();
  void Log(const Event& event) const;

private:
  EventSeverity min_severity_;
};

class EventBus {
public:
  using Subscriber = std::function<void(const Event&)>;

  static EventBus& Instance();

  void Publish(const Event& event);
  void Subscribe(Subscriber fn);

  // Routes events into a JSON line file in addition to the console.
  // Replaces any previously attached file logger.
  void AttachLogFile(const std::filesystem::path& log_path);

  EventBus();
  ~EventBus();
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

private:
  using SubscriberList = std::vector<Subscriber>;

  std::shared_ptr<const SubscriberList> subscribers_snapshot_;
  std::mutex subscribers_mutex_;
  std::shared_ptr<JsonLineLogger> file_logger_;
  std::mutex file_logger_mutex_;
  ConsoleSink console_;
};

void ResetEventBusForTesting();

}  // namespace rxg::orchestrator
