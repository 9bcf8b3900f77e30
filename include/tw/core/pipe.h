#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include "tw/core/io.h"
#include "tw/error.h"

namespace tw::core {

  namespace detail {
    class PipeBuffer;
  } // namespace detail

  class PipeReader;
  class PipeWriter;

  inline constexpr size_t kDefaultPipeCapacity = 256 * 1024;

  struct PipeEnds {
    std::shared_ptr<PipeReader> reader;
    std::shared_ptr<PipeWriter> writer;
  };

  // In-memory pipe with a bounded buffer. Writes block while the buffer is
  // full and fail once either end is closed; reads drain what was buffered
  // before reporting end of stream or the close error.
  PipeEnds MakePipe(size_t capacity = kDefaultPipeCapacity);

  class PipeReader : public Reader {
  public:
    explicit PipeReader(std::shared_ptr<detail::PipeBuffer> buffer) : buffer_(std::move(buffer)) {}
    ~PipeReader() override;

    size_t Read(std::span<uint8_t> out) override;
    void Close();
    void CloseWithError(const std::optional<Error>& err);

  private:
    std::shared_ptr<detail::PipeBuffer> buffer_;
  };

  class PipeWriter : public Writer {
  public:
    using Writer::Write;

    explicit PipeWriter(std::shared_ptr<detail::PipeBuffer> buffer) : buffer_(std::move(buffer)) {}
    ~PipeWriter() override;

    size_t Write(std::span<const uint8_t> data) override;
    void Close();
    // Readers see |err| after draining; std::nullopt gives a clean EOF.
    void CloseWithError(const std::optional<Error>& err);

  private:
    std::shared_ptr<detail::PipeBuffer> buffer_;
  };

} // namespace tw::core
