#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include <sys/types.h>

#include "tw/core/io.h"

namespace tw::platform {

  // Writer over a file descriptor, closed on destruction when owned.
  class FdWriter : public core::Writer {
  public:
    using core::Writer::Write;

    FdWriter(int fd, bool owned) noexcept : fd_(fd), owned_(owned) {}
    ~FdWriter() override;

    FdWriter(const FdWriter&) = delete;
    FdWriter& operator=(const FdWriter&) = delete;

    // Opens (creating with |permissions| if needed) |path| for appending.
    static std::shared_ptr<FdWriter> OpenAppend(const std::filesystem::path& path, mode_t permissions);
    static std::shared_ptr<FdWriter> Stdout();

    size_t Write(std::span<const uint8_t> data) override;

  private:
    int fd_;
    bool owned_;
    std::mutex mutex_;
  };

} // namespace tw::platform
