#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>

#include "tw/core/io.h"
#include "tw/core/json_codec.h"
#include "tw/error.h"

namespace tw::core {

  inline constexpr size_t kMaxFrameBytes = 16 * 1024 * 1024;

  namespace detail {
    // Splits a byte source into newline-terminated lines. A final line with
    // no terminator is still returned.
    class LineReader {
    public:
      LineReader(Reader& source, size_t max_line) : source_(source), max_line_(max_line) {}

      // std::nullopt at end of stream.
      std::optional<std::string> ReadLine();

    private:
      Reader& source_;
      const size_t max_line_;
      std::string buffer_;
      bool eof_{false};
    };
  } // namespace detail

  // Typed, bidirectional event channel over one duplex connection. Each event
  // is two newline-terminated lines: the name as a JSON string, then the
  // payload as any JSON value.
  //
  // Handlers are keyed by event name; the empty name is the fallback used when
  // no specific handler matches, and events matching neither are dropped.
  // Registering a name again replaces the earlier handler. Handlers run
  // synchronously on the thread calling RunOnce/Run, one at a time.
  class EventStream {
  public:
    using DecodeErrorHandler = std::function<void(const Error&)>;

    explicit EventStream(std::shared_ptr<Conn> conn, size_t max_frame = kMaxFrameBytes);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Registers |fn|, invoked as fn(name, T) with the payload decoded through
    // JsonCodec<T>. An empty |fn| removes the handler for |name|.
    template <typename T, typename F>
    void AddHandler(std::string name, F&& fn) {
      std::function<void(const std::string&, T)> typed(std::forward<F>(fn));
      if (!typed) {
        RemoveHandler(name);
        return;
      }
      SetDispatcher(std::move(name),
                    [typed = std::move(typed)](const std::string& event, const Json::Value& payload) {
                      typed(event, JsonCodec<T>::Decode(payload));
                    });
    }

    void RemoveHandler(const std::string& name);

    template <typename T>
    void Send(std::string_view name, const T& payload) {
      WriteFrame(name, ToJsonLine(JsonCodec<T>::Encode(payload)));
    }

    // Sends already-encoded JSON; |json| must hold exactly one JSON value.
    void SendRaw(std::string_view name, std::string_view json);

    // Reads and dispatches one event. Returns false on a clean end of stream.
    bool RunOnce();

    // Dispatches events until end of stream, which returns normally. A payload
    // that does not decode into its handler's type is reported to
    // |on_decode_error| and skipped; every other failure ends the loop and is
    // thrown.
    void Run(const DecodeErrorHandler& on_decode_error = nullptr);

    // Forwards newline-delimited JSON log records from |source|, each as an
    // event named by its "msg" field carrying the whole record. Returns when
    // |source| is exhausted.
    void SendJSONSLogs(Reader& source);

    void Close();
    [[nodiscard]] bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

  private:
    using Dispatcher = std::function<void(const std::string&, const Json::Value&)>;

    void SetDispatcher(std::string name, Dispatcher dispatcher);
    void WriteFrame(std::string_view name, std::string_view payload_line);
    [[noreturn]] void ThrowClosed() const;

    std::shared_ptr<Conn> conn_;
    std::atomic<bool> closed_{false};

    std::mutex read_mutex_; // held for a whole RunOnce, dispatch included
    detail::LineReader lines_;

    std::mutex write_mutex_;

    std::mutex handlers_mutex_;
    std::map<std::string, std::shared_ptr<const Dispatcher>, std::less<>> handlers_;
  };

} // namespace tw::core
