#include "tw/storage/io_util.h"

#include "tw/common.h"
#include "tw/crypto/random.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statfs.h>
#include <sys/types.h>
#include <unistd.h>

namespace tw::storage {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";
constexpr const char* kAtomicUnsupportedMessage = "Filesystem does not support atomic rename";

class ErrorContext { // accumulates nested call context
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

Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return Retryability::kTransient;
    default:
      break;
  }
  return Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               Retryability retry = Retryability::kFatal) {
  auto stack = ctx.Stack();
  std::optional<int> native_value = native;
  if (!native_value.has_value() && code != 0) {
    native_value = code;
  }
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native_value, retry, std::move(stack)};
}

[[noreturn]] void ThrowValidationError(const ErrorContext& ctx, std::string message) {
  throw Error{ErrorDomain::Validation, 0, ctx.Format(std::move(message)), std::nullopt,
              Retryability::kFatal, ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  auto merged = err.context;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               std::move(merged)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  throw Error{ErrorDomain::IO,
              sys_err.code().value(),
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyNativeError(sys_err.code().value()),
              ctx.Stack()};
}

[[noreturn]] void RethrowUnknownError(const std::exception& ex, const ErrorContext& ctx) {
  throw Error{ErrorDomain::Internal, 0, ctx.Format(ex.what()), std::nullopt,
              Retryability::kFatal, ctx.Stack()};
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
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

bool SupportsAtomicRename(const std::filesystem::path& dir) {
  std::error_code ec;
  auto absolute = std::filesystem::weakly_canonical(dir, ec);
  if (ec) {
    absolute = std::filesystem::absolute(dir, ec);
  }
  if (absolute.empty()) {
    return false;
  }

  struct statfs info {
  };
  if (::statfs(absolute.c_str(), &info) != 0) {
    return false;
  }

  switch (info.f_type) {
    case 0x6969:      // NFS_SUPER_MAGIC
    case 0xFF534D42:  // CIFS
    case 0xFE534D42:  // SMB2
    case 0x517B:      // SMB
      return false;
    default:
      return true;
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO,
                saved_errno,
                std::string(kAtomicReplaceErrorMessage) + ": open directory failed",
                saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    throw Error{ErrorDomain::IO,
                err,
                std::string(kAtomicReplaceErrorMessage) + ": directory flush failed",
                err,
                ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
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
      ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": fsync failed",
                   saved_errno, ClassifyNativeError(saved_errno));
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": write failed",
                   saved_errno, ClassifyNativeError(saved_errno));
    }
    if (chunk == 0) {
      ThrowIoError(ctx, 0, std::string(kAtomicReplaceErrorMessage) + ": short write", 0,
                   Retryability::kFatal);
    }
    written += static_cast<size_t>(chunk);
  }
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
  tw::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  static constexpr char kHex[] = "0123456789abcdef";
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  std::string token;
  for (auto byte : random) {
    token.push_back(kHex[(byte >> 4) & 0x0F]);
    token.push_back(kHex[byte & 0x0F]);
  }
  temp_name += token;
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   mode_t permissions, const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  try {
    if (target.empty()) {
      ThrowValidationError(ctx, "Target path required");
    }

    auto dir = target.parent_path();
    if (dir.empty()) {
      dir = WithContext(ctx, "resolving current working directory", [] {
        return std::filesystem::current_path();
      });
    }

    WithContext(ctx, "checking atomic rename support", [&] {
      if (!SupportsAtomicRename(dir)) {
        ThrowIoError(ctx, 0, kAtomicUnsupportedMessage, std::nullopt, Retryability::kFatal);
      }
    });

    auto temp_path = MakeTempPath(dir, target);
    TempFileGuard cleanup(temp_path);

    int fd = WithContext(ctx, "opening temporary file", [&]() {
      int handle = ::open(temp_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, permissions);
      if (handle < 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": open failed",
                     saved_errno, ClassifyNativeError(saved_errno));
      }
      return handle;
    });

    try {
      // The umask may have masked bits off at creation time.
      WithContext(ctx, "setting file permissions", [&] {
        if (::fchmod(fd, permissions) != 0) {
          const int saved_errno = errno;
          ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": chmod failed",
                       saved_errno, ClassifyNativeError(saved_errno));
        }
      });
      WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
      WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
    } catch (const Error&) {
      ::close(fd);
      throw;
    }

    WithContext(ctx, "closing temporary file", [&] {
      if (::close(fd) != 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx, saved_errno, std::string(kAtomicReplaceErrorMessage) + ": close failed",
                     saved_errno, ClassifyNativeError(saved_errno));
      }
    });

    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
    }

    WithContext(ctx, "renaming temporary file into place", [&] {
      if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        const int err = errno;
        ThrowIoError(ctx, err, std::string(kAtomicReplaceErrorMessage) + ": rename failed", err,
                     ClassifyNativeError(err));
      }
    });

    cleanup.Release();

    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir); });
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

std::optional<std::string> ReadWholeFile(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const int saved_errno = errno;
    if (saved_errno == ENOENT) {
      return std::nullopt;
    }
    throw Error{ErrorDomain::IO, errors::io::kFileOpenFailed,
                "Failed to open " + PathToUtf8String(path), saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  std::string contents;
  std::array<char, 8192> buffer{};
  for (;;) {
    auto got = ::read(fd, buffer.data(), buffer.size());
    if (got < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ::close(fd);
      throw Error{ErrorDomain::IO, errors::io::kReadFailed,
                  "Failed to read " + PathToUtf8String(path), saved_errno,
                  ClassifyNativeError(saved_errno)};
    }
    if (got == 0) {
      break;
    }
    contents.append(buffer.data(), static_cast<size_t>(got));
  }
  ::close(fd);
  return contents;
}

void EnsureDirectory(const std::filesystem::path& dir, mode_t permissions) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return;
  }
  std::filesystem::path partial;
  for (const auto& part : dir) {
    partial /= part;
    if (std::filesystem::is_directory(partial, ec)) {
      continue;
    }
    if (::mkdir(partial.c_str(), permissions) != 0 && errno != EEXIST) {
      const int saved_errno = errno;
      throw Error{ErrorDomain::IO, saved_errno,
                  "Failed to create directory " + PathToUtf8String(partial), saved_errno,
                  ClassifyNativeError(saved_errno)};
    }
  }
}

}  // namespace tw::storage
