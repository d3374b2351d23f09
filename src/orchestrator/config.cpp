#include "rxg/orchestrator/config.h"

#include "rxg/common.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/io_util.h"

#include <cstdlib>
#include <string>

#include <nlohmann/json.hpp>

namespace rxg::orchestrator {
namespace {

using nlohmann::json;

[[noreturn]] void ThrowConfigError(int code, std::string_view base, const std::string& detail) {
  std::string message(base);
  if (!detail.empty()) {
    message += ": " + detail;
  }
  throw Error{ErrorDomain::Config, code, std::move(message)};
}

std::filesystem::path RequirePath(const json& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_string()) {
    ThrowConfigError(errors::config::kMalformed, errors::msg::kConfigMissingKey, key);
  }
  return std::filesystem::path(it->get<std::string>());
}

template <typename T>
void ReadOptional(const json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  out = it->get<T>();
}

} // namespace

Config Config::Default(const std::filesystem::path& repo_dir,
                       std::vector<std::filesystem::path> data_dirs) {
  Config config;
  config.repo_dir = repo_dir;
  config.data_dirs = std::move(data_dirs);
  config.key_file = repo_dir / "keys" / "master.key";
  config.manifest_dir = repo_dir / "manifests";
  config.chunks_dir = repo_dir / "chunks";
  config.canary_dir = repo_dir / "canaries";
  config.log_file = repo_dir / "logs" / "rxguard.log";
  return config;
}

Config Config::Load(const std::filesystem::path& path) {
  auto bytes = ReadFileBytes(path);
  json doc;
  try {
    doc = json::parse(bytes.begin(), bytes.end());
  } catch (const json::parse_error& ex) {
    ThrowConfigError(errors::config::kMalformed, errors::msg::kConfigMalformed,
                     PathToUtf8String(path) + ": " + ex.what());
  }
  if (!doc.is_object()) {
    ThrowConfigError(errors::config::kMalformed, errors::msg::kConfigMalformed, PathToUtf8String(path));
  }

  Config config;
  try {
    config.repo_dir = RequirePath(doc, "repo_dir");
    config.key_file = RequirePath(doc, "key_file");
    config.manifest_dir = RequirePath(doc, "manifest_dir");
    config.chunks_dir = RequirePath(doc, "chunks_dir");
    config.canary_dir = RequirePath(doc, "canary_dir");
    config.log_file = RequirePath(doc, "log_file");

    auto dirs = doc.find("data_dirs");
    if (dirs == doc.end() || !dirs->is_array()) {
      ThrowConfigError(errors::config::kMalformed, errors::msg::kConfigMissingKey, "data_dirs");
    }
    for (const auto& dir : *dirs) {
      config.data_dirs.emplace_back(dir.get<std::string>());
    }

    ReadOptional(doc, "chunk_size_bytes", config.chunk_size_bytes);
    ReadOptional(doc, "modification_rate_threshold_per_minute",
                 config.modification_rate_threshold_per_minute);
    ReadOptional(doc, "entropy_threshold_modified_sample", config.entropy_threshold_modified_sample);
    ReadOptional(doc, "suspicious_extension_suffixes", config.suspicious_extension_suffixes);
    ReadOptional(doc, "alert_cooldown_seconds", config.alert_cooldown_seconds);
    ReadOptional(doc, "event_batch_size", config.event_batch_size);
    ReadOptional(doc, "entropy_sample_files", config.entropy_sample_files);
    ReadOptional(doc, "entropy_sample_bytes", config.entropy_sample_bytes);
    ReadOptional(doc, "event_queue_capacity", config.event_queue_capacity);
    ReadOptional(doc, "canaries_per_directory", config.canaries_per_directory);
  } catch (const json::exception& ex) {
    // type_error / out_of_range from a value of the wrong JSON type
    ThrowConfigError(errors::config::kMalformed, errors::msg::kConfigMalformed,
                     PathToUtf8String(path) + ": " + ex.what());
  }
  return config;
}

void Config::Save(const std::filesystem::path& path) const {
  json doc;
  doc["repo_dir"] = PathToUtf8String(repo_dir);
  json dirs = json::array();
  for (const auto& dir : data_dirs) {
    dirs.push_back(PathToUtf8String(dir));
  }
  doc["data_dirs"] = std::move(dirs);
  doc["key_file"] = PathToUtf8String(key_file);
  doc["manifest_dir"] = PathToUtf8String(manifest_dir);
  doc["chunks_dir"] = PathToUtf8String(chunks_dir);
  doc["canary_dir"] = PathToUtf8String(canary_dir);
  doc["log_file"] = PathToUtf8String(log_file);
  doc["chunk_size_bytes"] = chunk_size_bytes;
  doc["modification_rate_threshold_per_minute"] = modification_rate_threshold_per_minute;
  doc["entropy_threshold_modified_sample"] = entropy_threshold_modified_sample;
  doc["suspicious_extension_suffixes"] = suspicious_extension_suffixes;
  doc["alert_cooldown_seconds"] = alert_cooldown_seconds;
  doc["event_batch_size"] = event_batch_size;
  doc["entropy_sample_files"] = entropy_sample_files;
  doc["entropy_sample_bytes"] = entropy_sample_bytes;
  doc["event_queue_capacity"] = event_queue_capacity;
  doc["canaries_per_directory"] = canaries_per_directory;

  const std::string text = doc.dump(2) + "\n";
  AtomicReplace(path, AsByteSpan(text));
}

void Config::Validate() const {
  if (data_dirs.empty()) {
    ThrowConfigError(errors::config::kInvalidValue, errors::msg::kConfigNoDataDirs, "");
  }
  if (chunk_size_bytes == 0) {
    ThrowConfigError(errors::config::kInvalidValue, "chunk_size_bytes must be positive", "");
  }
  if (event_batch_size == 0) {
    ThrowConfigError(errors::config::kInvalidValue, "event_batch_size must be positive", "");
  }
  if (event_queue_capacity == 0) {
    ThrowConfigError(errors::config::kInvalidValue, "event_queue_capacity must be positive", "");
  }
  if (entropy_threshold_modified_sample < 0.0 || entropy_threshold_modified_sample > 8.0) {
    ThrowConfigError(errors::config::kInvalidValue,
                     "entropy_threshold_modified_sample must be within [0, 8]", "");
  }
}

std::filesystem::path DefaultConfigPath() {
  const char* env = std::getenv("RXG_CONFIG");
  if (env && *env != '\0') {
    return std::filesystem::path(env);
  }
  return std::filesystem::current_path() / "config.json";
}

} // namespace rxg::orchestrator
