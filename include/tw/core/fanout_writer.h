#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <utility>
#include <vector>

#include "tw/core/io.h"
#include "tw/error.h"

namespace tw::core {

  // Broadcasts every write to a dynamic set of sinks. A sink whose write fails
  // is dropped and its removal callback receives the failure; the caller's
  // Write always succeeds. Removal callbacks run on a dedicated dispatcher
  // thread, each at most once.
  class FanoutWriter : public Writer {
  public:
    using Writer::Write;
    using OnRemove = std::function<void(const std::optional<Error>&)>;

    FanoutWriter();
    explicit FanoutWriter(std::vector<std::shared_ptr<Writer>> sinks);
    ~FanoutWriter() override;

    FanoutWriter(const FanoutWriter&) = delete;
    FanoutWriter& operator=(const FanoutWriter&) = delete;

    size_t Write(std::span<const uint8_t> data) override;

    // A null sink is ignored. Adding a registered sink replaces its callback.
    void Add(std::shared_ptr<Writer> sink, OnRemove on_remove = nullptr);

    // Returns whether |sink| was registered. Its callback, if any, is
    // dispatched with no error.
    bool Remove(const std::shared_ptr<Writer>& sink);

    [[nodiscard]] size_t SinkCount() const;

  private:
    struct Entry {
      std::shared_ptr<Writer> sink;
      OnRemove on_remove;
    };
    struct PendingCallback {
      OnRemove fn;
      std::optional<Error> error;
    };

    void Dispatch(std::vector<PendingCallback> callbacks);
    void DispatchLoop();

    mutable std::mutex mutex_;
    std::vector<Entry> sinks_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<PendingCallback> pending_;
    bool stop_dispatcher_{false};
    std::thread dispatcher_thread_;

    static constexpr size_t kMaxPendingCallbacks = 1024;
  };

} // namespace tw::core
