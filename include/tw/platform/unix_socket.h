#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <utility>

#include "tw/core/io.h"
#include "tw/error.h"

namespace tw::platform {

  // Stream-oriented AF_UNIX connection. Close shuts the socket down so that
  // blocked readers and writers in other threads return; the descriptor is
  // released on destruction.
  class UnixConn : public core::Conn {
  public:
    using core::Writer::Write;

    explicit UnixConn(int fd) noexcept : fd_(fd) {}
    ~UnixConn() override;

    UnixConn(const UnixConn&) = delete;
    UnixConn& operator=(const UnixConn&) = delete;

    static std::shared_ptr<UnixConn> Dial(const std::filesystem::path& path);

    size_t Read(std::span<uint8_t> out) override;
    size_t Write(std::span<const uint8_t> data) override;
    void Close() override;

  private:
    int fd_;
    std::atomic<bool> closed_{false};
  };

  // Connected pair, for tests and in-process plumbing.
  std::pair<std::shared_ptr<UnixConn>, std::shared_ptr<UnixConn>> SocketPair();

  class UnixListener {
  public:
    // Binds and listens on |path|, which must not exist.
    static std::unique_ptr<UnixListener> Listen(const std::filesystem::path& path);
    ~UnixListener();

    UnixListener(const UnixListener&) = delete;
    UnixListener& operator=(const UnixListener&) = delete;

    // Blocks for the next connection. Throws tw::Error: kListenerClosed after
    // Close, kAcceptFailed (Retryability::kTransient for EMFILE/ENFILE)
    // otherwise.
    std::shared_ptr<UnixConn> Accept();

    // Stops accepting and unlinks the socket file. Idempotent.
    void Close();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    UnixListener(int fd, std::filesystem::path path) noexcept : fd_(fd), path_(std::move(path)) {}

    int fd_;
    std::filesystem::path path_;
    std::atomic<bool> closed_{false};
  };

} // namespace tw::platform
