#include "tw/core/fanout_writer.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "test_util.h"
#include "tw/errors.h"

namespace {

  using tw::test::Expect;
  using tw::test::FailingWriter;
  using tw::test::MemoryWriter;
  using tw::test::WaitUntil;

  struct CallbackLog {
    std::mutex mutex;
    std::vector<std::optional<tw::Error>> calls;

    tw::core::FanoutWriter::OnRemove Recorder() {
      return [this](const std::optional<tw::Error>& err) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(err);
      };
    }

    size_t size() {
      std::lock_guard<std::mutex> lock(mutex);
      return calls.size();
    }
  };

  void TestFailingSinksAreDropped() {
    constexpr size_t kGood = 3;
    constexpr size_t kBad = 2;
    tw::core::FanoutWriter fanout;
    CallbackLog removed;
    std::vector<std::shared_ptr<MemoryWriter>> good;
    std::vector<std::shared_ptr<FailingWriter>> bad;
    for (size_t i = 0; i < kGood; ++i) {
      good.push_back(std::make_shared<MemoryWriter>());
      fanout.Add(good.back(), removed.Recorder());
    }
    for (size_t i = 0; i < kBad; ++i) {
      bad.push_back(std::make_shared<FailingWriter>("disk on fire"));
      fanout.Add(bad.back(), removed.Recorder());
    }

    const size_t written = fanout.Write(std::string_view("first\n"));
    Expect(written == 6, "Write must report the full size despite failing sinks");
    Expect(WaitUntil([&] { return removed.size() == kBad; }), "Each failing sink must fire one removal callback");
    {
      std::lock_guard<std::mutex> lock(removed.mutex);
      for (const auto& call : removed.calls) {
        Expect(call.has_value() && call->code == tw::errors::io::kWriteFailed,
               "Removal callbacks must receive the triggering error");
        Expect(std::string(call->what()) == "disk on fire", "Removal error must be the sink's own error");
      }
    }
    Expect(fanout.SinkCount() == kGood, "Only surviving sinks may remain registered");

    fanout.Write(std::string_view("second\n"));
    for (const auto& sink : good) {
      Expect(sink->contents() == "first\nsecond\n", "Surviving sinks must receive every write");
    }
    for (const auto& sink : bad) {
      Expect(sink->attempts() == 1, "Dropped sinks must not be written again");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    Expect(removed.size() == kBad, "No sink may be reported removed twice");
  }

  void TestRemoveReportsNoError() {
    tw::core::FanoutWriter fanout;
    CallbackLog removed;
    auto sink = std::make_shared<MemoryWriter>();
    fanout.Add(sink, removed.Recorder());
    Expect(fanout.Remove(sink), "Remove must report a registered sink");
    Expect(!fanout.Remove(sink), "Removing an absent sink is a no-op");
    Expect(WaitUntil([&] { return removed.size() == 1; }), "Remove must fire the callback once");
    {
      std::lock_guard<std::mutex> lock(removed.mutex);
      Expect(!removed.calls.front().has_value(), "Explicit removal carries no error");
    }
    fanout.Write(std::string_view("ignored"));
    Expect(sink->contents().empty(), "Removed sinks must not be written");
  }

  void TestAddNullAndReplaceCallback() {
    tw::core::FanoutWriter fanout;
    fanout.Add(nullptr);
    Expect(fanout.SinkCount() == 0, "A null sink must be ignored");

    std::atomic<int> first{0};
    std::atomic<int> second{0};
    auto sink = std::make_shared<MemoryWriter>();
    fanout.Add(sink, [&](const std::optional<tw::Error>&) { ++first; });
    fanout.Add(sink, [&](const std::optional<tw::Error>&) { ++second; });
    Expect(fanout.SinkCount() == 1, "Adding a sink twice must not duplicate it");
    fanout.Write(std::string_view("once"));
    Expect(sink->contents() == "once", "A re-added sink must be written once per write");

    fanout.Remove(sink);
    Expect(WaitUntil([&] { return second.load() == 1; }), "The latest callback must fire");
    Expect(first.load() == 0, "A replaced callback must never fire");
  }

  void TestSlowCallbackDoesNotBlockWrite() {
    tw::core::FanoutWriter fanout;
    std::atomic<bool> release{false};
    std::atomic<bool> ran{false};
    auto bad = std::make_shared<FailingWriter>();
    auto good = std::make_shared<MemoryWriter>();
    fanout.Add(bad, [&](const std::optional<tw::Error>&) {
      while (!release.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
      ran = true;
    });
    fanout.Add(good);

    fanout.Write(std::string_view("a"));
    fanout.Write(std::string_view("b"));
    Expect(good->contents() == "ab", "Writes must complete while a removal callback is still running");
    release = true;
    Expect(WaitUntil([&] { return ran.load(); }), "The slow callback must eventually finish");
  }

  void TestThrowingCallbacksUnderBackpressure() {
    tw::core::FanoutWriter fanout;
    std::atomic<bool> release{false};
    std::atomic<bool> blocker_ran{false};
    auto blocker = std::make_shared<MemoryWriter>();
    fanout.Add(blocker, [&](const std::optional<tw::Error>&) {
      blocker_ran = true;
      while (!release.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    });
    fanout.Remove(blocker);
    Expect(WaitUntil([&] { return blocker_ran.load(); }), "The dispatcher must pick up the first callback");

    // More removals than the dispatcher queue holds: the excess runs on this
    // thread and every callback throws.
    constexpr int kSinks = 1100;
    std::atomic<int> calls{0};
    std::vector<std::shared_ptr<MemoryWriter>> sinks;
    for (int i = 0; i < kSinks; ++i) {
      sinks.push_back(std::make_shared<MemoryWriter>());
      fanout.Add(sinks.back(), [&](const std::optional<tw::Error>&) {
        ++calls;
        throw std::runtime_error("callback failed");
      });
    }
    for (const auto& sink : sinks) {
      Expect(fanout.Remove(sink), "Remove must succeed even when its callback throws");
    }
    Expect(calls.load() > 0, "Overflow callbacks run on the removing thread");
    release = true;
    Expect(WaitUntil([&] { return calls.load() == kSinks; }), "Every throwing callback must run exactly once");

    auto survivor = std::make_shared<MemoryWriter>();
    fanout.Add(survivor);
    fanout.Write(std::string_view("still alive"));
    Expect(survivor->contents() == "still alive", "The fanout must keep working after throwing callbacks");
  }

} // namespace

int main() {
  TestFailingSinksAreDropped();
  TestRemoveReportsNoError();
  TestAddNullAndReplaceCallback();
  TestSlowCallbackDoesNotBlockWrite();
  TestThrowingCallbacksUnderBackpressure();
  std::cout << "fanout writer tests ok" << std::endl;
  return 0;
}
