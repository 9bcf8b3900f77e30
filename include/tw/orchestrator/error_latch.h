#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include "tw/error.h"

namespace tw::orchestrator {

  // One-shot result shared between threads. The first Broadcast wins; Wait
  // blocks until then and returns it. std::nullopt means a clean finish.
  class ErrorLatch {
  public:
    // Returns true if this call set the result.
    bool Broadcast(std::optional<Error> result) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (set_) {
          return false;
        }
        set_ = true;
        result_ = std::move(result);
      }
      cv_.notify_all();
      return true;
    }

    std::optional<Error> Wait() {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&] { return set_; });
      return result_;
    }

    // false if nothing was broadcast within |timeout|.
    template <class Rep, class Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
      std::unique_lock<std::mutex> lock(mutex_);
      return cv_.wait_for(lock, timeout, [&] { return set_; });
    }

    [[nodiscard]] bool IsSet() {
      std::lock_guard<std::mutex> lock(mutex_);
      return set_;
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool set_{false};
    std::optional<Error> result_;
  };

} // namespace tw::orchestrator
