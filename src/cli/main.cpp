#include <algorithm>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <pthread.h>

#include "rxg/canary/canary_manager.h"
#include "rxg/common.h"
#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/config.h"
#include "rxg/orchestrator/event_bus.h"
#include "rxg/orchestrator/io_util.h"
#include "rxg/snapshot/repo.h"
#include "rxg/watcher/activity_watcher.h"
#include "rxg/watcher/change_source.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitWarning = 1;
constexpr int kExitUsage = 64;
constexpr int kExitConfig = 65;
constexpr int kExitIO = 66;
constexpr int kExitIntegrity = 67;
constexpr int kExitKey = 68;

constexpr std::size_t kListFilesLimit = 50;
constexpr std::size_t kDefaultSimulateCount = 200;
constexpr uint8_t kSimulateXorMask = 0x5A;
constexpr auto kSimulatePause = std::chrono::milliseconds(10);
constexpr std::string_view kSimulateSuffix = ".locked";

void PrintUsage() {
  std::cerr << "rxguard - snapshot backups with ransomware activity detection\n";
  std::cerr << "Usage:\n";
  std::cerr << "  rxguard init --repo=<dir> [--canaries=N] <data-dir>...\n";
  std::cerr << "  rxguard [--config=<file>] snapshot [--label=<text>]\n";
  std::cerr << "  rxguard [--config=<file>] list [--files]\n";
  std::cerr << "  rxguard [--config=<file>] restore --snapshot=<id> --dest=<dir> [--path=<prefix>]...\n";
  std::cerr << "  rxguard [--config=<file>] verify [--snapshot=<id>]\n";
  std::cerr << "  rxguard [--config=<file>] canary deploy [N]\n";
  std::cerr << "  rxguard [--config=<file>] canary check\n";
  std::cerr << "  rxguard [--config=<file>] protect\n";
  std::cerr << "  rxguard [--config=<file>] simulate [--count=N] [--target=<dir>]\n";
  std::cerr << "The configuration defaults to $RXG_CONFIG, then ./config.json.\n";
}

bool ValidateNoEmbeddedNull(std::string_view value, std::string_view description) {
  if (value.find('\0') != std::string_view::npos) {
    std::cerr << "Validation error: " << description << " contains embedded NUL byte." << std::endl;
    return false;
  }
  return true;
}

bool TryParsePathArgument(std::string_view raw, std::filesystem::path& out,
                          std::string_view description) {
  if (!ValidateNoEmbeddedNull(raw, description)) {
    return false;
  }
  if (raw.empty()) {
    std::cerr << "Validation error: " << description << " is required." << std::endl;
    return false;
  }
  out = std::filesystem::path(std::string(raw));
  return true;
}

bool TryParseCount(std::string_view raw, std::size_t& out, std::string_view description) {
  std::size_t parsed = 0;
  auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    std::cerr << "Validation error: " << description << " must be a non-negative integer." << std::endl;
    return false;
  }
  out = parsed;
  return true;
}

// Returns the value of |name|=value when |arg| carries that flag.
std::optional<std::string_view> FlagValue(std::string_view arg, std::string_view name) {
  if (arg.size() <= name.size() || arg.compare(0, name.size(), name) != 0 ||
      arg[name.size()] != '=') {
    return std::nullopt;
  }
  return arg.substr(name.size() + 1);
}

std::string_view DomainPrefix(rxg::ErrorDomain domain) {
  switch (domain) {
  case rxg::ErrorDomain::Security:
    return "Key error";
  case rxg::ErrorDomain::IO:
    return "I/O error";
  case rxg::ErrorDomain::Crypto:
    return "Integrity error";
  case rxg::ErrorDomain::Validation:
    return "Validation error";
  case rxg::ErrorDomain::Config:
    return "Config error";
  case rxg::ErrorDomain::State:
    return "State error";
  case rxg::ErrorDomain::Internal:
    return "Internal error";
  }
  return "Error";
}

void ReportError(const rxg::Error& err) {
  std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

  rxg::orchestrator::Event event;
  event.category = rxg::orchestrator::EventCategory::kDiagnostics;
  event.severity = rxg::orchestrator::EventSeverity::kDebug;
  event.event_id = "cli_error";
  event.message = err.what();
  event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
  event.fields.emplace_back("code", std::to_string(err.code),
                            rxg::orchestrator::FieldPrivacy::kPublic, true);
  if (err.native_code.has_value()) {
    event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                              rxg::orchestrator::FieldPrivacy::kPublic, true);
  }
  try {
    rxg::orchestrator::EventBus::Instance().Publish(event);
  } catch (const std::exception& publish_error) {
    std::clog << "{\"event_id\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
              << publish_error.what() << "\"}" << std::endl;
  }
}

int ExitCodeFor(const rxg::Error& err) {
  switch (err.domain) {
  case rxg::ErrorDomain::Security:
    return kExitKey;
  case rxg::ErrorDomain::Crypto:
    return err.code == rxg::errors::crypto::kIntegrityFailure ? kExitIntegrity : kExitIO;
  case rxg::ErrorDomain::Config:
    return kExitConfig;
  case rxg::ErrorDomain::Validation:
    return err.code == rxg::errors::validation::kCorruptManifest ? kExitIO : kExitUsage;
  case rxg::ErrorDomain::IO:
  case rxg::ErrorDomain::State:
  case rxg::ErrorDomain::Internal:
  default:
    return kExitIO;
  }
}

// A missing configuration file is a configuration problem, not an I/O one.
rxg::orchestrator::Config LoadConfig(const std::filesystem::path& path) {
  try {
    auto config = rxg::orchestrator::Config::Load(path);
    config.Validate();
    return config;
  } catch (const rxg::NotFoundError&) {
    throw rxg::Error{rxg::ErrorDomain::Config, rxg::errors::config::kMalformed,
                     std::string(rxg::errors::msg::kConfigNotFound) + ": " +
                         rxg::PathToUtf8String(path)};
  }
}

void AttachLog(const rxg::orchestrator::Config& config) {
  rxg::orchestrator::EnsureDirectory(config.log_file.parent_path());
  rxg::orchestrator::EventBus::Instance().AttachLogFile(config.log_file);
}

int HandleInit(const std::filesystem::path& repo_dir,
               const std::vector<std::filesystem::path>& data_dirs, std::size_t canaries) {
  std::vector<std::filesystem::path> absolute_dirs;
  absolute_dirs.reserve(data_dirs.size());
  for (const auto& dir : data_dirs) {
    absolute_dirs.push_back(std::filesystem::absolute(dir).lexically_normal());
  }
  auto config = rxg::orchestrator::Config::Default(
      std::filesystem::absolute(repo_dir).lexically_normal(), std::move(absolute_dirs));
  config.canaries_per_directory = canaries;
  config.Validate();

  auto repo = rxg::snapshot::Repo::Init(config);
  AttachLog(config);
  rxg::canary::CanaryManager canary_manager(config);
  auto deployed = canary_manager.Deploy(canaries);
  const auto config_path = config.ConfigPath();
  config.Save(config_path);

  std::cout << "Initialized repository at " << rxg::PathToUtf8String(config.repo_dir)
            << ". Config: " << rxg::PathToUtf8String(config_path) << '\n';
  std::cout << "Deployed " << deployed.size() << " canaries" << std::endl;
  return kExitOk;
}

int HandleSnapshot(const rxg::orchestrator::Config& config, const std::optional<std::string>& label) {
  auto repo = rxg::snapshot::Repo::Open(config);
  auto result = repo->CreateSnapshot(label);
  std::cout << "Snapshot " << result.snapshot.id << " created with " << result.snapshot.files.size()
            << " files (" << result.chunks_written << " new chunks, " << result.chunks_deduplicated
            << " deduplicated)" << std::endl;
  for (const auto& skipped : result.skipped) {
    std::cerr << "  skipped " << skipped.path << ": " << skipped.message << '\n';
  }
  return kExitOk;
}

int HandleList(const rxg::orchestrator::Config& config, bool with_files) {
  auto repo = rxg::snapshot::Repo::Open(config);
  if (!with_files) {
    for (const auto& id : repo->ListSnapshots()) {
      std::cout << id << '\n';
    }
    std::cout.flush();
    return kExitOk;
  }
  for (const auto& id : repo->ListSnapshots()) {
    auto snapshot = repo->LoadSnapshot(id);
    std::cout << id << " (" << snapshot.files.size() << " files";
    if (snapshot.label) {
      std::cout << ", label " << *snapshot.label;
    }
    std::cout << ", created " << snapshot.created_at << ")\n";
    const auto shown = std::min(snapshot.files.size(), kListFilesLimit);
    for (std::size_t i = 0; i < shown; ++i) {
      const auto& entry = snapshot.files[i];
      std::cout << "   " << entry.path << " chunks=" << entry.chunks.size() << '\n';
    }
    if (snapshot.files.size() > kListFilesLimit) {
      std::cout << "   ...\n";
    }
  }
  std::cout.flush();
  return kExitOk;
}

int HandleRestore(const rxg::orchestrator::Config& config, const std::string& snapshot_id,
                  const std::filesystem::path& dest, const std::vector<std::string>& prefixes) {
  auto repo = rxg::snapshot::Repo::Open(config);
  auto result = repo->Restore(snapshot_id, dest, prefixes);
  std::cout << "Restored " << result.restored_files.size() << " files from snapshot " << snapshot_id
            << " to " << rxg::PathToUtf8String(dest) << std::endl;
  if (!result.Complete()) {
    for (const auto& failure : result.failures) {
      std::cerr << "  failed " << failure.path << ": " << failure.message << '\n';
    }
    std::cerr << rxg::errors::msg::kRestorePartial << " (" << result.failures.size() << " files)"
              << std::endl;
    return kExitWarning;
  }
  return kExitOk;
}

int HandleVerify(const rxg::orchestrator::Config& config, const std::optional<std::string>& snapshot_id) {
  auto repo = rxg::snapshot::Repo::Open(config);
  auto result = repo->Verify(snapshot_id);
  if (result.missing_chunks == 0 && result.unreadable_manifests == 0) {
    std::cout << "OK: " << result.file_count << " files, no missing chunks" << std::endl;
    return kExitOk;
  }
  std::cout << "WARN: " << result.file_count << " files, missing chunks: " << result.missing_chunks;
  if (result.unreadable_manifests > 0) {
    std::cout << ", unreadable manifests: " << result.unreadable_manifests;
  }
  std::cout << std::endl;
  return kExitWarning;
}

int HandleCanaryDeploy(const rxg::orchestrator::Config& config, std::size_t per_directory) {
  rxg::canary::CanaryManager canary_manager(config);
  auto deployed = canary_manager.Deploy(per_directory);
  std::cout << "Deployed " << deployed.size() << " canaries" << std::endl;
  return kExitOk;
}

int HandleCanaryCheck(const rxg::orchestrator::Config& config) {
  rxg::canary::CanaryManager canary_manager(config);
  auto report = canary_manager.Inspect();
  if (report.tampered.empty()) {
    std::cout << "OK: " << report.total << " canaries intact" << std::endl;
    return kExitOk;
  }
  std::cout << "WARN: " << report.tampered.size() << " of " << report.total << " canaries tampered\n";
  for (const auto& path : report.tampered) {
    std::cout << "  " << path << '\n';
  }
  std::cout.flush();
  return kExitWarning;
}

// Runs the watcher until SIGINT or SIGTERM. The signals are blocked before
// any thread starts so only the dedicated waiter receives them.
int HandleProtect(const rxg::orchestrator::Config& config) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGUSR1);  // internal wake-up for the waiter
  if (int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
    throw rxg::Error{rxg::ErrorDomain::State, 0,
                     std::string("pthread_sigmask failed: ") + std::strerror(rc), rc};
  }

  auto repo = rxg::snapshot::Repo::Open(config);
  rxg::canary::CanaryManager canary_manager(config);
  auto source = std::make_unique<rxg::watcher::InotifySource>(
      config.data_dirs, std::vector<std::filesystem::path>{config.repo_dir});
  rxg::watcher::ActivityWatcher watcher(config, *repo, canary_manager, std::move(source));

  std::atomic<bool> waiter_done{false};
  std::thread waiter([&]() {
    int received = 0;
    while (sigwait(&signals, &received) != 0) {
    }
    if (received != SIGUSR1) {
      std::cerr << "Stopping watcher..." << std::endl;
      watcher.Stop();
    }
    waiter_done.store(true);
  });

  std::cout << "Protecting " << config.data_dirs.size() << " data directories; Ctrl+C to stop"
            << std::endl;
  int exit_code = kExitOk;
  try {
    watcher.Run();
  } catch (const rxg::Error& err) {
    ReportError(err);
    exit_code = ExitCodeFor(err);
  }
  if (!waiter_done.load()) {
    pthread_kill(waiter.native_handle(), SIGUSR1);
  }
  waiter.join();

  const auto stats = watcher.Stats();
  std::cout << "Watcher stopped: " << stats.events << " events, " << stats.alerts << " alerts, "
            << stats.snapshots << " containment snapshots" << std::endl;
  return exit_code;
}

std::vector<std::filesystem::path> CollectRegularFiles(const std::vector<std::filesystem::path>& roots,
                                                       const std::filesystem::path& excluded) {
  std::vector<std::filesystem::path> files;
  rxg::orchestrator::TreeWalkVisitor visitor;
  visitor.enter_directory = [&excluded](const std::filesystem::path& dir) {
    std::error_code ec;
    return !std::filesystem::equivalent(dir, excluded, ec);
  };
  visitor.regular_file = [&files](const std::filesystem::path& path) { files.push_back(path); };
  visitor.unreadable = [](const std::filesystem::path& dir, const std::error_code& ec) {
    std::cerr << "  skipped " << rxg::PathToUtf8String(dir) << ": " << ec.message() << '\n';
  };
  for (const auto& root : roots) {
    rxg::orchestrator::WalkTree(root, visitor);
  }
  return files;
}

// Non-destructive attack drill: writes XOR-scrambled copies with a
// ransomware-style suffix next to the originals.
int HandleSimulate(const rxg::orchestrator::Config& config, std::size_t count,
                   const std::optional<std::filesystem::path>& target) {
  const std::vector<std::filesystem::path> roots =
      target ? std::vector<std::filesystem::path>{*target} : config.data_dirs;
  auto files = CollectRegularFiles(roots, config.repo_dir);
  for (std::size_t i = files.size(); i > 1; --i) {
    const auto j = rxg::crypto::RandomUniform(static_cast<uint32_t>(i));
    std::swap(files[i - 1], files[j]);
  }

  std::size_t modified = 0;
  for (const auto& path : files) {
    if (modified >= count) {
      break;
    }
    if (path.extension().string() == kSimulateSuffix) {
      continue;
    }
    std::vector<uint8_t> data;
    try {
      data = rxg::orchestrator::ReadFileBytes(path);
    } catch (const rxg::Error& err) {
      std::cerr << "  skipped " << rxg::PathToUtf8String(path) << ": " << err.what() << '\n';
      continue;
    }
    for (auto& byte : data) {
      byte ^= kSimulateXorMask;
    }
    auto locked = path;
    locked += std::string(kSimulateSuffix);
    std::ofstream out(locked, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
      std::cerr << "  skipped " << rxg::PathToUtf8String(path) << ": write failed\n";
      continue;
    }
    ++modified;
    std::this_thread::sleep_for(kSimulatePause);
  }
  std::cout << "Simulated modification of " << modified
            << " files (non-destructive copies with .locked)" << std::endl;
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    std::optional<std::filesystem::path> config_path;
    int index = 1;
    while (index < argc) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (auto value = FlagValue(arg, "--config")) {
        std::filesystem::path parsed;
        if (!TryParsePathArgument(*value, parsed, "config path")) {
          PrintUsage();
          return kExitUsage;
        }
        config_path = parsed;
        ++index;
        continue;
      }
      if (arg == "--help") {
        PrintUsage();
        return kExitOk;
      }
      std::cerr << "Unknown option: " << arg << std::endl;
      PrintUsage();
      return kExitUsage;
    }
    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    std::string cmd = argv[index++];

    if (cmd == "init") {
      std::optional<std::filesystem::path> repo_dir;
      std::size_t canaries = 3;
      std::vector<std::filesystem::path> data_dirs;
      for (int i = index; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (auto value = FlagValue(arg, "--repo")) {
          std::filesystem::path parsed;
          if (!TryParsePathArgument(*value, parsed, "repository directory")) {
            PrintUsage();
            return kExitUsage;
          }
          repo_dir = parsed;
          continue;
        }
        if (auto value = FlagValue(arg, "--canaries")) {
          if (!TryParseCount(*value, canaries, "canary count")) {
            PrintUsage();
            return kExitUsage;
          }
          continue;
        }
        std::filesystem::path parsed;
        if (arg.rfind("--", 0) == 0 || !TryParsePathArgument(arg, parsed, "data directory")) {
          PrintUsage();
          return kExitUsage;
        }
        data_dirs.push_back(parsed);
      }
      if (!repo_dir || data_dirs.empty()) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleInit(*repo_dir, data_dirs, canaries);
    }

    const auto config = LoadConfig(config_path ? *config_path : rxg::orchestrator::DefaultConfigPath());
    AttachLog(config);

    if (cmd == "snapshot") {
      std::optional<std::string> label;
      for (int i = index; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = FlagValue(arg, "--label");
        if (!value || !ValidateNoEmbeddedNull(*value, "label")) {
          PrintUsage();
          return kExitUsage;
        }
        label = std::string(*value);
      }
      return HandleSnapshot(config, label);
    }
    if (cmd == "list") {
      bool with_files = false;
      for (int i = index; i < argc; ++i) {
        if (std::string_view(argv[i]) != "--files") {
          PrintUsage();
          return kExitUsage;
        }
        with_files = true;
      }
      return HandleList(config, with_files);
    }
    if (cmd == "restore") {
      std::optional<std::string> snapshot_id;
      std::optional<std::filesystem::path> dest;
      std::vector<std::string> prefixes;
      for (int i = index; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (auto value = FlagValue(arg, "--snapshot")) {
          if (value->empty()) {
            PrintUsage();
            return kExitUsage;
          }
          snapshot_id = std::string(*value);
          continue;
        }
        if (auto value = FlagValue(arg, "--dest")) {
          std::filesystem::path parsed;
          if (!TryParsePathArgument(*value, parsed, "destination directory")) {
            PrintUsage();
            return kExitUsage;
          }
          dest = parsed;
          continue;
        }
        if (auto value = FlagValue(arg, "--path")) {
          if (value->empty() || !ValidateNoEmbeddedNull(*value, "path prefix")) {
            PrintUsage();
            return kExitUsage;
          }
          prefixes.emplace_back(*value);
          continue;
        }
        PrintUsage();
        return kExitUsage;
      }
      if (!snapshot_id || !dest) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleRestore(config, *snapshot_id, *dest, prefixes);
    }
    if (cmd == "verify") {
      std::optional<std::string> snapshot_id;
      for (int i = index; i < argc; ++i) {
        auto value = FlagValue(argv[i], "--snapshot");
        if (!value || value->empty()) {
          PrintUsage();
          return kExitUsage;
        }
        snapshot_id = std::string(*value);
      }
      return HandleVerify(config, snapshot_id);
    }
    if (cmd == "canary") {
      if (index >= argc) {
        PrintUsage();
        return kExitUsage;
      }
      std::string_view action = argv[index++];
      if (action == "deploy") {
        std::size_t per_directory = config.canaries_per_directory;
        if (argc - index > 1 ||
            (argc - index == 1 && !TryParseCount(argv[index], per_directory, "canary count"))) {
          PrintUsage();
          return kExitUsage;
        }
        return HandleCanaryDeploy(config, per_directory);
      }
      if (action == "check" && index == argc) {
        return HandleCanaryCheck(config);
      }
      PrintUsage();
      return kExitUsage;
    }
    if (cmd == "protect") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleProtect(config);
    }
    if (cmd == "simulate") {
      std::size_t count = kDefaultSimulateCount;
      std::optional<std::filesystem::path> target;
      for (int i = index; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (auto value = FlagValue(arg, "--count")) {
          if (!TryParseCount(*value, count, "file count")) {
            PrintUsage();
            return kExitUsage;
          }
          continue;
        }
        if (auto value = FlagValue(arg, "--target")) {
          std::filesystem::path parsed;
          if (!TryParsePathArgument(*value, parsed, "target directory")) {
            PrintUsage();
            return kExitUsage;
          }
          target = parsed;
          continue;
        }
        PrintUsage();
        return kExitUsage;
      }
      return HandleSimulate(config, count, target);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const rxg::PartialRestoreError& err) {
    ReportError(err);
    return kExitWarning;
  } catch (const rxg::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
