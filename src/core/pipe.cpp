#include "tw/core/pipe.h"

#include <algorithm>
#include <string>

#include "tw/errors.h"

namespace tw::core {
namespace detail {

class PipeBuffer {
public:
  explicit PipeBuffer(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

  size_t Write(std::span<const uint8_t> data) {
    std::unique_lock<std::mutex> lock(mutex_);
    size_t written = 0;
    while (written < data.size()) {
      cv_.wait(lock, [&] { return reader_closed_ || writer_closed_ || bytes_.size() < capacity_; });
      if (reader_closed_ || writer_closed_) {
        throw ClosedError(reader_closed_ ? reader_error_ : std::nullopt);
      }
      const size_t room = capacity_ - bytes_.size();
      const size_t chunk = std::min(room, data.size() - written);
      bytes_.insert(bytes_.end(), data.begin() + static_cast<std::ptrdiff_t>(written),
                    data.begin() + static_cast<std::ptrdiff_t>(written + chunk));
      written += chunk;
      cv_.notify_all();
    }
    return written;
  }

  size_t Read(std::span<uint8_t> out) {
    if (out.empty()) {
      return 0;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return reader_closed_ || writer_closed_ || !bytes_.empty(); });
    if (reader_closed_) {
      throw ClosedError(std::nullopt);
    }
    if (bytes_.empty()) {
      if (writer_error_) {
        throw *writer_error_;
      }
      return 0;
    }
    const size_t chunk = std::min(out.size(), bytes_.size());
    std::copy_n(bytes_.begin(), chunk, out.begin());
    bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(chunk));
    cv_.notify_all();
    return chunk;
  }

  void CloseReader(const std::optional<Error>& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reader_closed_) {
      reader_closed_ = true;
      reader_error_ = err;
    }
    cv_.notify_all();
  }

  void CloseWriter(const std::optional<Error>& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writer_closed_) {
      writer_closed_ = true;
      writer_error_ = err;
    }
    cv_.notify_all();
  }

private:
  // Writers see the reader's close reason when one was given.
  static Error ClosedError(const std::optional<Error>& reason) {
    if (reason) {
      return Error{ErrorDomain::IO, errors::io::kPipeClosed,
                   std::string(errors::msg::kPipeClosed) + ": " + reason->what(),
                   reason->native_code, Retryability::kFatal};
    }
    return Error{ErrorDomain::IO, errors::io::kPipeClosed, std::string(errors::msg::kPipeClosed)};
  }

  const size_t capacity_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint8_t> bytes_;
  bool reader_closed_{false};
  bool writer_closed_{false};
  std::optional<Error> reader_error_;
  std::optional<Error> writer_error_;
};

} // namespace detail

PipeEnds MakePipe(size_t capacity) {
  auto buffer = std::make_shared<detail::PipeBuffer>(capacity);
  return PipeEnds{std::make_shared<PipeReader>(buffer), std::make_shared<PipeWriter>(buffer)};
}

PipeReader::~PipeReader() { buffer_->CloseReader(std::nullopt); }

size_t PipeReader::Read(std::span<uint8_t> out) { return buffer_->Read(out); }

void PipeReader::Close() { buffer_->CloseReader(std::nullopt); }

void PipeReader::CloseWithError(const std::optional<Error>& err) { buffer_->CloseReader(err); }

PipeWriter::~PipeWriter() { buffer_->CloseWriter(std::nullopt); }

size_t PipeWriter::Write(std::span<const uint8_t> data) { return buffer_->Write(data); }

void PipeWriter::Close() { buffer_->CloseWriter(std::nullopt); }

void PipeWriter::CloseWithError(const std::optional<Error>& err) { buffer_->CloseWriter(err); }

} // namespace tw::core
