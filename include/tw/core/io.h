#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace tw::core {

  // Byte source. Read blocks until at least one byte is available and returns
  // the number of bytes stored in |out|; 0 means end of stream. Failures are
  // thrown as tw::Error.
  class Reader {
  public:
    virtual ~Reader() = default;
    virtual size_t Read(std::span<uint8_t> out) = 0;
  };

  // Byte sink. Write either consumes the whole buffer or throws tw::Error.
  class Writer {
  public:
    virtual ~Writer() = default;
    virtual size_t Write(std::span<const uint8_t> data) = 0;

    size_t Write(std::string_view text) {
      return Write(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }
  };

  // Duplex connection. Close may be called from any thread and unblocks
  // pending reads and writes.
  class Conn : public Reader, public Writer {
  public:
    using Writer::Write;
    virtual void Close() = 0;
  };

} // namespace tw::core
