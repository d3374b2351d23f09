#include "rxg/watcher/change_source.h"

#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include "rxg/common.h"
#include "rxg/error.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/event_bus.h"
#include "rxg/orchestrator/io_util.h"

namespace rxg::watcher {

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_MOVED_FROM | IN_MOVED_TO | IN_ONLYDIR;
constexpr std::size_t kMaxPendingMoves = 1024;
constexpr std::size_t kReadBufferSize = 64 * 1024;

void PublishWatchEvent(rxg::orchestrator::EventSeverity severity, const char* event_id,
                       std::string message) {
  rxg::orchestrator::Event event;
  event.category = rxg::orchestrator::EventCategory::kDiagnostics;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  rxg::orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

struct InotifySource::State {
  int inotify_fd{-1};
  int stop_read{-1};
  int stop_write{-1};
  Sink sink;
  std::vector<std::filesystem::path> excluded;
  std::unordered_map<int, std::filesystem::path> watches;
  std::unordered_map<uint32_t, std::string> pending_moves;  // cookie -> source path

  std::mutex done_mutex;
  std::condition_variable done_cv;
  bool done{false};

  State() = default;
  State(const State&) = delete;
  State& operator=(const State&) = delete;
  ~State() {
    for (int fd : {inotify_fd, stop_read, stop_write}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  // Returns false when the kernel refused the watch.
  bool AddWatch(const std::filesystem::path& dir) {
    int wd = ::inotify_add_watch(inotify_fd, dir.c_str(), kWatchMask);
    if (wd < 0) {
      const int saved_errno = errno;
      PublishWatchEvent(rxg::orchestrator::EventSeverity::kWarning, "watch_add_failed",
                        std::string(errors::msg::kWatchSetupFailed) + ": " + PathToUtf8String(dir) +
                            ": " + std::strerror(saved_errno));
      return false;
    }
    watches[wd] = dir;
    return true;
  }

  bool IsExcluded(const std::filesystem::path& dir) const {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(dir, ec);
    const auto normal = (ec ? dir : absolute).lexically_normal();
    for (const auto& root : excluded) {
      auto rel = normal.lexically_relative(root);
      if (!rel.empty() && *rel.begin() != "..") {
        return true;
      }
    }
    return false;
  }

  void AddWatchTree(const std::filesystem::path& root) {
    if (IsExcluded(root) || !AddWatch(root)) {
      return;
    }
    rxg::orchestrator::TreeWalkVisitor visitor;
    visitor.enter_directory = [this](const std::filesystem::path& dir) {
      return !IsExcluded(dir) && AddWatch(dir);
    };
    visitor.unreadable = [](const std::filesystem::path& dir, const std::error_code& ec) {
      PublishWatchEvent(rxg::orchestrator::EventSeverity::kWarning, "watch_tree_unreadable",
                        PathToUtf8String(dir) + ": " + ec.message());
    };
    rxg::orchestrator::WalkTree(root, visitor);
  }

  void Dispatch(const inotify_event& raw) {
    if (raw.mask & IN_Q_OVERFLOW) {
      PublishWatchEvent(rxg::orchestrator::EventSeverity::kWarning, "watch_queue_overflow",
                        "Kernel event queue overflowed; some changes were not reported");
      return;
    }
    if (raw.mask & IN_IGNORED) {
      watches.erase(raw.wd);
      return;
    }
    auto it = watches.find(raw.wd);
    if (it == watches.end() || raw.len == 0) {
      return;
    }
    const auto full = it->second / raw.name;

    if (raw.mask & IN_ISDIR) {
      if (raw.mask & (IN_CREATE | IN_MOVED_TO)) {
        AddWatchTree(full);
      }
      return;
    }

    const std::string path = PathToUtf8String(full);
    if (raw.mask & IN_MOVED_FROM) {
      if (pending_moves.size() >= kMaxPendingMoves) {
        pending_moves.clear();  // moved out of the tree; never paired
      }
      pending_moves[raw.cookie] = path;
      return;
    }
    if (raw.mask & IN_MOVED_TO) {
      auto from = pending_moves.find(raw.cookie);
      if (from != pending_moves.end()) {
        sink(ChangeEvent{ChangeKind::kMoved, from->second, path});
        pending_moves.erase(from);
      } else {
        sink(ChangeEvent{ChangeKind::kCreated, path, {}});
      }
      return;
    }
    if (raw.mask & IN_CREATE) {
      sink(ChangeEvent{ChangeKind::kCreated, path, {}});
      return;
    }
    if (raw.mask & IN_MODIFY) {
      sink(ChangeEvent{ChangeKind::kModified, path, {}});
    }
  }
};

namespace {

void ReaderLoop(std::shared_ptr<InotifySource::State> state) {
  alignas(inotify_event) std::array<char, kReadBufferSize> buffer{};
  std::array<pollfd, 2> fds{};
  fds[0].fd = state->inotify_fd;
  fds[0].events = POLLIN;
  fds[1].fd = state->stop_read;
  fds[1].events = POLLIN;

  for (;;) {
    int ready = ::poll(fds.data(), fds.size(), -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      PublishWatchEvent(rxg::orchestrator::EventSeverity::kError, "watch_poll_failed",
                        std::strerror(errno));
      break;
    }
    if (fds[1].revents != 0) {
      break;
    }
    if ((fds[0].revents & POLLIN) == 0) {
      continue;
    }
    ssize_t got = ::read(state->inotify_fd, buffer.data(), buffer.size());
    if (got < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      PublishWatchEvent(rxg::orchestrator::EventSeverity::kError, "watch_read_failed",
                        std::strerror(errno));
      break;
    }
    for (ssize_t offset = 0; offset < got;) {
      const auto* raw = reinterpret_cast<const inotify_event*>(buffer.data() + offset);
      state->Dispatch(*raw);
      offset += static_cast<ssize_t>(sizeof(inotify_event) + raw->len);
    }
  }

  {
    std::lock_guard<std::mutex> guard(state->done_mutex);
    state->done = true;
  }
  state->done_cv.notify_all();
}

}  // namespace

InotifySource::InotifySource(std::vector<std::filesystem::path> roots,
                             std::vector<std::filesystem::path> excluded,
                             std::chrono::milliseconds stop_timeout)
    : roots_(std::move(roots)), stop_timeout_(stop_timeout) {
  for (const auto& dir : excluded) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(dir, ec);
    excluded_.push_back((ec ? dir : absolute).lexically_normal());
  }
}

InotifySource::~InotifySource() {
  Stop();
}

void InotifySource::Start(Sink sink) {
  if (state_) {
    throw Error{ErrorDomain::State, 0, "InotifySource already started"};
  }
  auto state = std::make_shared<State>();
  state->inotify_fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (state->inotify_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kWatchFailed,
                std::string(errors::msg::kWatchSetupFailed) + ": inotify_init1: " +
                    std::strerror(saved_errno),
                saved_errno};
  }
  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC | O_NONBLOCK) != 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kWatchFailed,
                std::string(errors::msg::kWatchSetupFailed) + ": pipe2: " + std::strerror(saved_errno),
                saved_errno};
  }
  state->stop_read = pipe_fds[0];
  state->stop_write = pipe_fds[1];
  state->sink = std::move(sink);
  state->excluded = excluded_;

  for (const auto& root : roots_) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
      throw Error{ErrorDomain::IO, errors::io::kWatchFailed,
                  std::string(errors::msg::kWatchSetupFailed) + ": " + PathToUtf8String(root)};
    }
    state->AddWatchTree(root);
  }

  state_ = state;
  reader_ = std::thread(ReaderLoop, std::move(state));
  PublishWatchEvent(rxg::orchestrator::EventSeverity::kInfo, "watch_started",
                    "Watching " + std::to_string(roots_.size()) + " director" +
                        (roots_.size() == 1 ? "y" : "ies"));
}

void InotifySource::Stop() {
  if (!state_) {
    return;
  }
  const char wake = 1;
  while (::write(state_->stop_write, &wake, 1) < 0 && errno == EINTR) {
  }

  bool finished = false;
  {
    std::unique_lock<std::mutex> lock(state_->done_mutex);
    finished = state_->done_cv.wait_for(lock, stop_timeout_, [this] { return state_->done; });
  }
  if (reader_.joinable()) {
    if (finished) {
      reader_.join();
    } else {
      // The thread holds its own reference to the state, so detaching is safe.
      reader_.detach();
      PublishWatchEvent(rxg::orchestrator::EventSeverity::kWarning, "watch_stop_timeout",
                        "Watcher thread did not stop in time; detached");
    }
  }
  state_.reset();
}

}  // namespace rxg::watcher
