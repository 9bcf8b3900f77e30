#include "tw/platform/fd_writer.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "tw/common.h"
#include "tw/error.h"

namespace tw::platform {

FdWriter::~FdWriter() {
  if (owned_ && fd_ >= 0) {
    ::close(fd_);
  }
}

std::shared_ptr<FdWriter> FdWriter::OpenAppend(const std::filesystem::path& path, mode_t permissions) {
  int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, permissions);
  if (fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kFileOpenFailed,
                "open " + PathToUtf8String(path) + ": " + std::strerror(saved_errno), saved_errno};
  }
  return std::make_shared<FdWriter>(fd, true);
}

std::shared_ptr<FdWriter> FdWriter::Stdout() {
  return std::make_shared<FdWriter>(STDOUT_FILENO, false);
}

size_t FdWriter::Write(std::span<const uint8_t> data) {
  // One record per call; keep concurrent writers from interleaving.
  std::lock_guard<std::mutex> lock(mutex_);
  size_t written = 0;
  while (written < data.size()) {
    auto n = ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      throw Error{ErrorDomain::IO, errors::io::kWriteFailed, std::string("write: ") + std::strerror(saved_errno),
                  saved_errno};
    }
    written += static_cast<size_t>(n);
  }
  return written;
}

} // namespace tw::platform
