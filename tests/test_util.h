#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <json/json.h>

#include "tw/core/event_stream.h"
#include "tw/core/io.h"
#include "tw/error.h"
#include "tw/errors.h"
#include "tw/platform/unix_socket.h"

namespace tw::test {

  class TempDir {
  public:
    explicit TempDir(const std::string& prefix) {
      auto base = std::filesystem::temp_directory_path();
      auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
      path_ = base / (prefix + std::to_string(static_cast<unsigned long long>(stamp)));
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_{};
  };

  [[noreturn]] inline void Fail(const std::string& what) {
    std::cerr << what << std::endl;
    std::abort();
  }

  inline void Expect(bool condition, const std::string& what) {
    if (!condition) {
      Fail(what);
    }
  }

  template <class Pred>
  bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
  }

  // Thread-safe in-memory sink.
  class MemoryWriter : public core::Writer {
  public:
    using core::Writer::Write;

    size_t Write(std::span<const uint8_t> data) override {
      std::lock_guard<std::mutex> lock(mutex_);
      contents_.append(reinterpret_cast<const char*>(data.data()), data.size());
      ++writes_;
      return data.size();
    }

    std::string contents() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return contents_;
    }

    size_t writes() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return writes_;
    }

    // Complete lines written so far, parsed as JSON.
    std::vector<Json::Value> Records() const {
      std::vector<Json::Value> records;
      std::istringstream in(contents());
      std::string line;
      Json::CharReaderBuilder builder;
      while (std::getline(in, line)) {
        if (line.empty()) {
          continue;
        }
        Json::Value value;
        std::string errs;
        std::istringstream line_in(line);
        if (!Json::parseFromStream(builder, line_in, &value, &errs)) {
          Fail("unparseable log line: " + line);
        }
        records.push_back(std::move(value));
      }
      return records;
    }

    // Records whose msg is |msg|.
    std::vector<Json::Value> RecordsWithMsg(std::string_view msg) const {
      std::vector<Json::Value> out;
      for (auto& record : Records()) {
        if (record["msg"].asString() == msg) {
          out.push_back(std::move(record));
        }
      }
      return out;
    }

  private:
    mutable std::mutex mutex_;
    std::string contents_;
    size_t writes_{0};
  };

  // Writer which fails every write.
  class FailingWriter : public core::Writer {
  public:
    using core::Writer::Write;

    explicit FailingWriter(std::string reason = "sink broken") : reason_(std::move(reason)) {}

    size_t Write(std::span<const uint8_t>) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++attempts_;
      throw Error{ErrorDomain::IO, errors::io::kWriteFailed, reason_};
    }

    size_t attempts() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return attempts_;
    }

  private:
    const std::string reason_;
    mutable std::mutex mutex_;
    size_t attempts_{0};
  };

  struct ReceivedEvent {
    std::string name;
    Json::Value payload;
  };

  // Operator-side peer for exercising the server: every event lands in
  // NextEvent's return value.
  class TestOperator {
  public:
    explicit TestOperator(std::shared_ptr<core::Conn> conn) : stream_(std::move(conn)) {
      stream_.AddHandler<Json::Value>("", [this](const std::string& name, const Json::Value& payload) {
        last_ = ReceivedEvent{name, payload};
      });
    }

    static std::unique_ptr<TestOperator> Dial(const std::filesystem::path& socket) {
      return std::make_unique<TestOperator>(platform::UnixConn::Dial(socket));
    }

    core::EventStream& stream() { return stream_; }

    // std::nullopt at end of stream.
    std::optional<ReceivedEvent> NextEvent() {
      last_.reset();
      while (!last_) {
        if (!stream_.RunOnce()) {
          return std::nullopt;
        }
      }
      return last_;
    }

    // Skips events until one named |name| arrives.
    ReceivedEvent WaitFor(std::string_view name) {
      for (;;) {
        auto event = NextEvent();
        if (!event) {
          Fail("stream ended while waiting for \"" + std::string(name) + "\"");
        }
        if (event->name == name) {
          return *event;
        }
      }
    }

  private:
    core::EventStream stream_;
    std::optional<ReceivedEvent> last_;
  };

} // namespace tw::test
