#include "rxg/orchestrator/io_util.h"

#include "rxg/common.h"
#include "rxg/crypto/random.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace rxg::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";
constexpr const char* kPrivateWriteErrorMessage = "Private file write failed";
constexpr const char* kReadErrorMessage = "File read failed";

class ErrorContext { // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

rxg::Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return rxg::Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return rxg::Retryability::kTransient;
    default:
      break;
  }
  return rxg::Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int native, std::string message) {
  std::optional<int> native_value;
  if (native != 0) {
    native_value = native;
  }
  throw Error{ErrorDomain::IO, errors::io::kWriteFailed, ctx.Format(std::move(message)), native_value,
              ClassifyNativeError(native), ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  auto merged = err.context;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               std::move(merged)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, ctx.Format(sys_err.what()),
                sys_err.code().value(), ClassifyNativeError(sys_err.code().value()), ctx.Stack()};
  }
}

void SyncFileWithRetry(int fd, ErrorContext& ctx, const char* stage_message) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    const bool transient = saved_errno == EAGAIN || saved_errno == EBUSY;
    if (attempt >= kMaxRetries || !transient) {
      ThrowIoError(ctx, saved_errno, std::string(stage_message) + ": fsync failed");
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx, const char* stage_message) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, saved_errno, std::string(stage_message) + ": write failed");
    }
    if (chunk == 0) {
      ThrowIoError(ctx, 0, std::string(stage_message) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return;  // best effort; some filesystems refuse directory handles
  }
  (void)::fsync(fd);
  ::close(fd);
}

class TempFileGuard { // removes the staging file unless released
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 8> random{};
  rxg::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += HexEncode(random);
  return dir / temp_name;
}

}  // namespace

void EnsureDirectory(const std::filesystem::path& dir) {
  if (dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed,
                "Failed to create directory " + PathToUtf8String(dir) + ": " + ec.message(),
                ec.value(), ClassifyNativeError(ec.value())};
  }
}

void WalkTree(const std::filesystem::path& root, const TreeWalkVisitor& visitor) {
  std::vector<std::pair<std::filesystem::path, std::filesystem::directory_iterator>> stack;
  auto open_dir = [&](const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
      if (visitor.unreadable) {
        visitor.unreadable(dir, ec);
      }
      return;
    }
    stack.emplace_back(dir, std::move(it));
  };

  open_dir(root);
  while (!stack.empty()) {
    auto& [dir, it] = stack.back();
    if (it == std::filesystem::directory_iterator()) {
      stack.pop_back();
      continue;
    }
    const std::filesystem::directory_entry entry = *it;
    std::error_code ec;
    it.increment(ec);
    if (ec) {
      // the remaining entries of this directory are lost; report and move on
      if (visitor.unreadable) {
        visitor.unreadable(dir, ec);
      }
      stack.pop_back();
    }

    std::error_code type_ec;
    if (entry.is_symlink(type_ec)) {
      continue;
    }
    if (entry.is_directory(type_ec)) {
      if (!visitor.enter_directory || visitor.enter_directory(entry.path())) {
        open_dir(entry.path());
      }
      continue;
    }
    if (entry.is_regular_file(type_ec) && visitor.regular_file) {
      visitor.regular_file(entry.path());
    }
  }
}

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    throw Error{ErrorDomain::Validation, 0, ctx.Format("Target path required"), std::nullopt,
                rxg::Retryability::kFatal, ctx.Stack()};
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = WithContext(ctx, "resolving current working directory", [] {
      return std::filesystem::current_path();
    });
  }
  WithContext(ctx, "creating parent directory", [&] { EnsureDirectory(dir); });

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  int fd = WithContext(ctx, "opening temporary payload file", [&]() {
    int handle = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (handle < 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": open failed");
    }
    return handle;
  });

  try {
    WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx, kAtomicReplaceErrorMessage); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx, kAtomicReplaceErrorMessage); });
  } catch (...) {
    ::close(fd);
    throw;
  }

  WithContext(ctx, "closing temporary payload file", [&] {
    if (::close(fd) != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": close failed");
    }
  });

  if (hooks.before_rename) {
    hooks.before_rename(temp_path, target);
  }

  WithContext(ctx, "renaming temporary file into place", [&] {
    if (std::rename(temp_path.c_str(), target.c_str()) != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": rename failed");
    }
  });

  cleanup.Release();
  SyncDirectory(dir);
}

void WritePrivateFile(const std::filesystem::path& path, std::span<const uint8_t> payload) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "private write target=" + PathToUtf8String(path));

  WithContext(ctx, "creating parent directory", [&] { EnsureDirectory(path.parent_path()); });

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, saved_errno, std::string(kPrivateWriteErrorMessage) + ": open failed");
  }
  try {
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno,
                   std::string(kPrivateWriteErrorMessage) + ": failed to restrict permissions");
    }
    WriteAll(fd, payload, ctx, kPrivateWriteErrorMessage);
    SyncFileWithRetry(fd, ctx, kPrivateWriteErrorMessage);
  } catch (...) {
    ::close(fd);
    throw;
  }
  if (::close(fd) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, saved_errno, std::string(kPrivateWriteErrorMessage) + ": close failed");
  }
}

std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const int saved_errno = errno;
    if (saved_errno == ENOENT) {
      throw NotFoundError("No such file: " + PathToUtf8String(path), saved_errno);
    }
    throw Error{ErrorDomain::IO, errors::io::kReadFailed,
                std::string(kReadErrorMessage) + ": " + PathToUtf8String(path) + ": " +
                    std::system_category().message(saved_errno),
                saved_errno, ClassifyNativeError(saved_errno)};
  }
  std::vector<uint8_t> data;
  std::array<uint8_t, 64 * 1024> buffer{};
  for (;;) {
    auto got = ::read(fd, buffer.data(), buffer.size());
    if (got < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ::close(fd);
      throw Error{ErrorDomain::IO, errors::io::kReadFailed,
                  std::string(kReadErrorMessage) + ": " + PathToUtf8String(path) + ": " +
                      std::system_category().message(saved_errno),
                  saved_errno, ClassifyNativeError(saved_errno)};
    }
    if (got == 0) {
      break;
    }
    data.insert(data.end(), buffer.begin(), buffer.begin() + got);
  }
  ::close(fd);
  return data;
}

}  // namespace rxg::orchestrator
