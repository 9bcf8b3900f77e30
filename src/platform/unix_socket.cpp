#include "tw/platform/unix_socket.h"

#include "tw/common.h"
#include "tw/errors.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace tw::platform {
namespace {

Retryability ClassifySocketError(int native) {
  switch (native) {
  case EINTR:
  case EAGAIN:
    return Retryability::kRetryable;
  case EMFILE:
  case ENFILE:
  case ENOBUFS:
  case ENOMEM:
    return Retryability::kTransient;
  default:
    return Retryability::kFatal;
  }
}

[[noreturn]] void ThrowSocketError(int code, const std::string& what, int native) {
  throw Error{ErrorDomain::IO, code, what + ": " + std::strerror(native), native,
              ClassifySocketError(native)};
}

sockaddr_un MakeAddress(const std::filesystem::path& path) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  const std::string native = PathToUtf8String(path);
  if (native.empty() || native.size() >= sizeof(addr.sun_path)) {
    throw Error{ErrorDomain::Validation, 0, "Unix socket path too long or empty: " + native};
  }
  std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);
  return addr;
}

} // namespace

UnixConn::~UnixConn() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::shared_ptr<UnixConn> UnixConn::Dial(const std::filesystem::path& path) {
  auto addr = MakeAddress(path);
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    ThrowSocketError(errors::io::kSocketFailed, "socket", errno);
  }
  auto conn = std::make_shared<UnixConn>(fd);
  for (;;) {
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      return conn;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    ThrowSocketError(errors::io::kSocketFailed, "connect " + PathToUtf8String(path), saved_errno);
  }
}

size_t UnixConn::Read(std::span<uint8_t> out) {
  for (;;) {
    auto got = ::read(fd_, out.data(), out.size());
    if (got >= 0) {
      return static_cast<size_t>(got);
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (closed_.load(std::memory_order_acquire)) {
      return 0;
    }
    ThrowSocketError(errors::io::kReadFailed, "read", saved_errno);
  }
}

size_t UnixConn::Write(std::span<const uint8_t> data) {
  size_t written = 0;
  while (written < data.size()) {
    auto sent = ::send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
    if (sent < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowSocketError(errors::io::kWriteFailed, "write", saved_errno);
    }
    written += static_cast<size_t>(sent);
  }
  return written;
}

void UnixConn::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  // ENOTCONN when the peer is already gone; nothing left to shut down.
  ::shutdown(fd_, SHUT_RDWR);
}

std::pair<std::shared_ptr<UnixConn>, std::shared_ptr<UnixConn>> SocketPair() {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    ThrowSocketError(errors::io::kSocketFailed, "socketpair", errno);
  }
  return {std::make_shared<UnixConn>(fds[0]), std::make_shared<UnixConn>(fds[1])};
}

std::unique_ptr<UnixListener> UnixListener::Listen(const std::filesystem::path& path) {
  auto addr = MakeAddress(path);
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    ThrowSocketError(errors::io::kSocketFailed, "socket", errno);
  }
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int saved_errno = errno;
    ::close(fd);
    ThrowSocketError(errors::io::kSocketFailed, "bind " + PathToUtf8String(path), saved_errno);
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    const int saved_errno = errno;
    ::close(fd);
    ::unlink(path.c_str());
    ThrowSocketError(errors::io::kSocketFailed, "listen " + PathToUtf8String(path), saved_errno);
  }
  return std::unique_ptr<UnixListener>(new UnixListener(fd, path));
}

UnixListener::~UnixListener() {
  Close();
  ::close(fd_);
}

std::shared_ptr<UnixConn> UnixListener::Accept() {
  for (;;) {
    if (closed_.load(std::memory_order_acquire)) {
      throw Error{ErrorDomain::IO, errors::io::kListenerClosed, std::string(errors::msg::kListenerClosed)};
    }
    int fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd >= 0) {
      return std::make_shared<UnixConn>(fd);
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR || saved_errno == ECONNABORTED) {
      continue;
    }
    if (closed_.load(std::memory_order_acquire)) {
      throw Error{ErrorDomain::IO, errors::io::kListenerClosed, std::string(errors::msg::kListenerClosed)};
    }
    ThrowSocketError(errors::io::kAcceptFailed, "accept", saved_errno);
  }
}

void UnixListener::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  // Wakes a thread blocked in accept4 (it returns EINVAL).
  ::shutdown(fd_, SHUT_RDWR);
  ::unlink(path_.c_str());
}

} // namespace tw::platform
