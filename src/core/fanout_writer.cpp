#include "tw/core/fanout_writer.h"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <string>
#include <system_error>

#include "tw/core/json_codec.h"

namespace tw::core {
namespace {

// Performs one sink write, converting any failure into a tw::Error.
std::optional<Error> WriteOne(Writer& sink, std::span<const uint8_t> data) {
  try {
    sink.Write(data);
    return std::nullopt;
  } catch (const Error& err) {
    return err;
  } catch (const std::exception& ex) {
    return Error{ErrorDomain::IO, errors::io::kWriteFailed, ex.what()};
  }
}

void RunRemoval(const FanoutWriter::OnRemove& fn, const std::optional<Error>& error) {
  try {
    fn(error);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"fanout_error\",\"message\":\"removal callback threw\",\"detail\":"
              << ToJsonLine(Json::Value(ex.what())) << "}" << std::endl;
  }
}

} // namespace

FanoutWriter::FanoutWriter() : dispatcher_thread_([this] { DispatchLoop(); }) {}

FanoutWriter::FanoutWriter(std::vector<std::shared_ptr<Writer>> sinks) : FanoutWriter() {
  for (auto& sink : sinks) {
    Add(std::move(sink));
  }
}

FanoutWriter::~FanoutWriter() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stop_dispatcher_ = true;
  }
  queue_cv_.notify_all();
  if (dispatcher_thread_.joinable()) {
    dispatcher_thread_.join();
  }
}

size_t FanoutWriter::Write(std::span<const uint8_t> data) {
  std::vector<PendingCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::optional<Error>> results(sinks_.size());
    if (sinks_.size() == 1) {
      results[0] = WriteOne(*sinks_[0].sink, data);
    } else if (!sinks_.empty()) {
      std::vector<std::future<std::optional<Error>>> inflight;
      inflight.reserve(sinks_.size());
      for (auto& entry : sinks_) {
        Writer* sink = entry.sink.get();
        auto task = [sink, data] { return WriteOne(*sink, data); };
        try {
          inflight.push_back(std::async(std::launch::async, task));
        } catch (const std::system_error&) {
          // No thread available: the write runs on this thread at get().
          inflight.push_back(std::async(std::launch::deferred, task));
        }
      }
      for (size_t i = 0; i < inflight.size(); ++i) {
        results[i] = inflight[i].get();
      }
    }

    std::vector<Entry> survivors;
    survivors.reserve(sinks_.size());
    for (size_t i = 0; i < sinks_.size(); ++i) {
      if (!results[i]) {
        survivors.push_back(std::move(sinks_[i]));
        continue;
      }
      if (sinks_[i].on_remove) {
        callbacks.push_back(PendingCallback{std::move(sinks_[i].on_remove), std::move(results[i])});
      }
    }
    sinks_ = std::move(survivors);
  }
  Dispatch(std::move(callbacks));
  return data.size();
}

void FanoutWriter::Add(std::shared_ptr<Writer> sink, OnRemove on_remove) {
  if (!sink) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(sinks_.begin(), sinks_.end(),
                         [&](const Entry& entry) { return entry.sink.get() == sink.get(); });
  if (it != sinks_.end()) {
    it->on_remove = std::move(on_remove);
    return;
  }
  sinks_.push_back(Entry{std::move(sink), std::move(on_remove)});
}

bool FanoutWriter::Remove(const std::shared_ptr<Writer>& sink) {
  std::vector<PendingCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(sinks_.begin(), sinks_.end(),
                           [&](const Entry& entry) { return entry.sink.get() == sink.get(); });
    if (it == sinks_.end()) {
      return false;
    }
    if (it->on_remove) {
      callbacks.push_back(PendingCallback{std::move(it->on_remove), std::nullopt});
    }
    sinks_.erase(it);
  }
  Dispatch(std::move(callbacks));
  return true;
}

size_t FanoutWriter::SinkCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.size();
}

void FanoutWriter::Dispatch(std::vector<PendingCallback> callbacks) {
  if (callbacks.empty()) {
    return;
  }
  std::vector<PendingCallback> overflow;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto& callback : callbacks) {
      if (pending_.size() >= kMaxPendingCallbacks || stop_dispatcher_) {
        overflow.push_back(std::move(callback));
      } else {
        pending_.push_back(std::move(callback));
      }
    }
  }
  queue_cv_.notify_one();
  // Backpressure: a saturated queue runs callbacks on the caller, after the
  // sink lock has been released.
  if (!overflow.empty()) {
    std::clog << "{\"event\":\"fanout_backpressure\",\"message\":\"removal callback queue full\",\"count\":"
              << overflow.size() << "}" << std::endl;
    for (auto& callback : overflow) {
      RunRemoval(callback.fn, callback.error);
    }
  }
}

void FanoutWriter::DispatchLoop() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  for (;;) {
    queue_cv_.wait(lock, [&] { return stop_dispatcher_ || !pending_.empty(); });
    if (pending_.empty()) {
      return; // stopping and drained
    }
    PendingCallback callback = std::move(pending_.front());
    pending_.pop_front();
    lock.unlock();
    RunRemoval(callback.fn, callback.error);
    lock.lock();
  }
}

} // namespace tw::core
