#include "tw/core/event_stream.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <json/json.h>

#include "test_util.h"
#include "tw/core/pipe.h"
#include "tw/errors.h"
#include "tw/orchestrator/json_logger.h"
#include "tw/platform/unix_socket.h"

namespace {

  using tw::test::Expect;
  using tw::test::Fail;

  struct Pair {
    std::shared_ptr<tw::platform::UnixConn> left_conn;
    std::shared_ptr<tw::platform::UnixConn> right_conn;
    std::unique_ptr<tw::core::EventStream> left;
    std::unique_ptr<tw::core::EventStream> right;
  };

  Pair MakePair() {
    Pair pair;
    std::tie(pair.left_conn, pair.right_conn) = tw::platform::SocketPair();
    pair.left = std::make_unique<tw::core::EventStream>(pair.left_conn);
    pair.right = std::make_unique<tw::core::EventStream>(pair.right_conn);
    return pair;
  }

  template <class Fn>
  std::optional<tw::Error> Capture(Fn&& fn) {
    try {
      fn();
    } catch (const tw::Error& err) {
      return err;
    }
    return std::nullopt;
  }

  void TestOrderedDelivery() {
    auto pair = MakePair();
    std::vector<std::pair<std::string, std::string>> seen;
    pair.right->AddHandler<Json::Value>("", [&](const std::string& name, const Json::Value& payload) {
      seen.emplace_back(name, tw::core::ToJsonLine(payload));
    });

    std::thread sender([&] {
      for (int i = 0; i < 50; ++i) {
        Json::Value payload(Json::objectValue);
        payload["n"] = i;
        payload["text"] = "line\nbreak \"quoted\"";
        pair.left->Send("event-" + std::to_string(i % 3), payload);
      }
      pair.left->Close();
    });
    pair.right->Run();
    sender.join();

    Expect(seen.size() == 50, "Every sent event must be received");
    for (int i = 0; i < 50; ++i) {
      Json::Value want(Json::objectValue);
      want["n"] = i;
      want["text"] = "line\nbreak \"quoted\"";
      Expect(seen[static_cast<size_t>(i)].first == "event-" + std::to_string(i % 3), "Event names out of order");
      Expect(seen[static_cast<size_t>(i)].second == tw::core::ToJsonLine(want), "Payload must round-trip");
    }
  }

  void TestTypedHandlersAndFallback() {
    auto pair = MakePair();
    std::string greeting;
    int64_t count = 0;
    std::vector<std::string> fallback;
    pair.right->AddHandler<std::string>("greet", [&](const std::string&, std::string text) { greeting = text; });
    pair.right->AddHandler<int64_t>("count", [&](const std::string&, int64_t n) { count = n; });
    pair.right->AddHandler<Json::Value>("", [&](const std::string& name, const Json::Value&) {
      fallback.push_back(name);
    });

    pair.left->Send("greet", std::string("hello"));
    pair.left->Send("count", int64_t{42});
    pair.left->Send("other", true);
    pair.left->Close();
    pair.right->Run();

    Expect(greeting == "hello", "String handler must receive its payload");
    Expect(count == 42, "Integer handler must receive its payload");
    Expect(fallback.size() == 1 && fallback.front() == "other", "Unmatched events go to the fallback");
  }

  void TestLastRegistrationWinsAndRemoval() {
    auto pair = MakePair();
    int first = 0;
    int second = 0;
    pair.right->AddHandler<Json::Value>("x", [&](const std::string&, const Json::Value&) { ++first; });
    pair.right->AddHandler<Json::Value>("x", [&](const std::string&, const Json::Value&) { ++second; });

    pair.left->Send("x", Json::Value());
    Expect(pair.right->RunOnce(), "RunOnce must dispatch one event");
    Expect(first == 0 && second == 1, "The later registration must replace the earlier one");

    pair.right->RemoveHandler("x");
    pair.left->Send("x", Json::Value());
    Expect(pair.right->RunOnce(), "An unhandled event is consumed, not an error");
    Expect(second == 1, "A removed handler must not run");

    pair.right->AddHandler<Json::Value>("x", [&](const std::string&, const Json::Value&) { ++second; });
    pair.right->AddHandler<Json::Value>("x", std::function<void(const std::string&, Json::Value)>());
    pair.left->Send("x", Json::Value());
    Expect(pair.right->RunOnce(), "An unhandled event is consumed, not an error");
    Expect(second == 1, "Registering an empty callback must remove the handler");
  }

  void TestPayloadMismatch() {
    auto pair = MakePair();
    std::vector<std::string> names;
    pair.right->AddHandler<std::string>("name", [&](const std::string&, std::string name) { names.push_back(name); });

    pair.left->Send("name", int64_t{7});
    auto err = Capture([&] { pair.right->RunOnce(); });
    Expect(err && err->code == tw::errors::protocol::kPayloadMismatch, "RunOnce must report payload mismatches");
    Expect(std::string(err->what()).find("\"name\"") != std::string::npos, "Mismatch must name the event");

    // Run reports the mismatch and keeps going.
    std::vector<tw::Error> reported;
    pair.left->Send("name", Json::Value(Json::arrayValue));
    pair.left->Send("name", std::string("alice"));
    pair.left->Close();
    pair.right->Run([&](const tw::Error& decode_error) { reported.push_back(decode_error); });
    Expect(reported.size() == 1, "Run must report each undecodable message once");
    Expect(names.size() == 1 && names.front() == "alice", "Run must continue after a decode error");
  }

  void TestDefaultDecodeReportIsJson() {
    auto pair = MakePair();
    pair.right->AddHandler<std::string>("name", [](const std::string&, std::string) {});
    pair.left->Send("name", int64_t{7});
    pair.left->Close();

    std::ostringstream captured;
    std::streambuf* saved = std::clog.rdbuf(captured.rdbuf());
    auto err = Capture([&] { pair.right->Run(); });
    std::clog.rdbuf(saved);

    Expect(!err, "Run must absorb decode errors");
    std::string line = captured.str();
    while (!line.empty() && line.back() == '\n') {
      line.pop_back();
    }
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value report;
    std::string errs;
    Expect(reader->parse(line.data(), line.data() + line.size(), &report, &errs),
           "The diagnostic line must be valid JSON: " + line);
    Expect(report["event"].asString() == "estream_error", "The diagnostic names its event");
    Expect(report["detail"].asString().find("\"name\"") != std::string::npos,
           "The detail keeps the quoted event name");
  }

  void TestMalformedFrames() {
    {
      auto pair = MakePair();
      pair.left_conn->Write(std::string_view("{\"not\":\"a name\"}\nnull\n"));
      auto err = Capture([&] { pair.right->RunOnce(); });
      Expect(err && err->code == tw::errors::protocol::kMalformedFrame, "A non-string name is malformed");
    }
    {
      auto pair = MakePair();
      pair.left_conn->Write(std::string_view("\"ok\"\n{broken\n"));
      auto err = Capture([&] { pair.right->RunOnce(); });
      Expect(err && err->code == tw::errors::protocol::kMalformedFrame, "Invalid payload JSON is malformed");
    }
    {
      auto pair = MakePair();
      pair.left_conn->Write(std::string_view("\"lonely\"\n"));
      pair.left_conn->Close();
      auto err = Capture([&] { pair.right->RunOnce(); });
      Expect(err && err->code == tw::errors::protocol::kMalformedFrame, "A name without payload is malformed");
    }
    {
      auto [a, b] = tw::platform::SocketPair();
      tw::core::EventStream small(b, 64);
      std::thread writer([conn = a] {
        conn->Write(std::string_view("\"" + std::string(200, 'n') + "\"\nnull\n"));
        conn->Close();
      });
      auto err = Capture([&] { small.RunOnce(); });
      writer.join();
      Expect(err && err->code == tw::errors::protocol::kFrameTooLong, "Oversized lines must be rejected");
    }
  }

  void TestEndOfStreamAndClose() {
    auto pair = MakePair();
    pair.left_conn->Write(std::string_view("\n\n"));
    pair.left->Close();
    Expect(!pair.right->RunOnce(), "Blank lines then EOF are a clean end of stream");

    pair.right->Close();
    pair.right->Close();
    Expect(pair.right->closed(), "Close must be idempotent");
    auto err = Capture([&] { pair.right->Send("late", Json::Value()); });
    Expect(err && err->code == tw::errors::io::kStreamClosed, "Send after Close must fail");
    err = Capture([&] { pair.right->RunOnce(); });
    Expect(err && err->code == tw::errors::io::kStreamClosed, "RunOnce after Close must fail");
  }

  void TestCloseUnblocksReader() {
    auto pair = MakePair();
    std::optional<tw::Error> err;
    std::thread reader([&] { err = Capture([&] { pair.right->Run(); }); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pair.right->Close();
    reader.join();
    Expect(err && err->code == tw::errors::io::kStreamClosed, "Closing a stream must end a blocked Run");
  }

  void TestSendRaw() {
    auto pair = MakePair();
    std::vector<Json::Value> got;
    pair.right->AddHandler<Json::Value>("", [&](const std::string&, const Json::Value& payload) {
      got.push_back(payload);
    });
    pair.left->SendRaw("raw", "{\"a\": 1}");
    pair.left->SendRaw("raw", "{\n  \"b\": [1,\n 2]\n}\n");
    auto err = Capture([&] { pair.left->SendRaw("raw", "{nope"); });
    Expect(err && err->code == tw::errors::protocol::kMalformedFrame, "SendRaw must validate its payload");
    pair.left->Close();
    pair.right->Run();
    Expect(got.size() == 2, "Both valid raw payloads must arrive");
    Expect(got[0]["a"].asInt() == 1 && got[1]["b"].size() == 2, "Raw payloads must arrive intact");
  }

  void TestSendJSONSLogs() {
    auto pair = MakePair();
    auto pipe = tw::core::MakePipe();
    std::vector<std::pair<std::string, Json::Value>> events;
    pair.right->AddHandler<Json::Value>("", [&](const std::string& name, const Json::Value& payload) {
      events.emplace_back(name, payload);
    });

    std::thread bridge([&] {
      pair.left->SendJSONSLogs(*pipe.reader);
      pair.left->Close();
    });
    pipe.writer->Write(std::string_view("{\"time\":\"t\",\"level\":\"INFO\",\"msg\":\"Operator connected\",\"cnum\":1}\n"));
    pipe.writer->Write(std::string_view("\n{\"msg\":\"Task queued\",\"qlen\":2}\n"));
    pipe.writer->Close();
    pair.right->Run();
    bridge.join();

    Expect(events.size() == 2, "Each log record becomes one event");
    Expect(events[0].first == "Operator connected" && events[0].second["cnum"].asInt() == 1,
           "Records are forwarded under their msg");
    Expect(events[1].first == "Task queued" && events[1].second["qlen"].asInt() == 2,
           "The whole record is the payload");

    auto bad = MakePair();
    auto bad_pipe = tw::core::MakePipe();
    bad_pipe.writer->Write(std::string_view("{\"level\":\"INFO\"}\n"));
    bad_pipe.writer->Close();
    auto err = Capture([&] { bad.left->SendJSONSLogs(*bad_pipe.reader); });
    Expect(err && err->code == tw::errors::protocol::kMalformedFrame, "Records without msg must be rejected");
  }

  void TestSendJSONSLogsDuplicateKeys() {
    auto pair = MakePair();
    auto pipe = tw::core::MakePipe();
    std::vector<std::pair<std::string, Json::Value>> events;
    pair.right->AddHandler<Json::Value>("", [&](const std::string& name, const Json::Value& payload) {
      events.emplace_back(name, payload);
    });

    std::optional<tw::Error> bridge_error;
    std::thread bridge([&] {
      bridge_error = Capture([&] { pair.left->SendJSONSLogs(*pipe.reader); });
      pair.left->Close();
    });
    // A bound field repeated by the record itself yields a repeated key.
    tw::orchestrator::JsonLineLogger logger(pipe.writer);
    logger.With({{"id", "a"}}).Info("Task request", {{"id", "b"}});
    pipe.writer->Write(std::string_view("{\"msg\":\"Task queued\",\"qlen\":1,\"qlen\":2}\n"));
    pipe.writer->Close();
    pair.right->Run();
    bridge.join();

    Expect(!bridge_error, "Records with repeated keys must be bridged");
    Expect(events.size() == 2, "Both records must arrive");
    Expect(events[0].first == "Task request" && events[0].second["id"].asString() == "b",
           "The last occurrence of a repeated key wins");
    Expect(events[1].first == "Task queued" && events[1].second["qlen"].asInt() == 2,
           "Hand-written records with repeated keys must arrive");
  }

  void TestConcurrentLargeSends() {
    constexpr int kSenders = 4;
    constexpr int kMessages = 25;
    constexpr size_t kBlobBytes = 300000; // larger than a socket buffer
    auto pair = MakePair();

    std::vector<int> next_seq(kSenders, 0);
    int received = 0;
    bool intact = true;
    pair.right->AddHandler<Json::Value>("blob", [&](const std::string&, const Json::Value& payload) {
      ++received;
      const int sender = payload["sender"].asInt();
      if (sender < 0 || sender >= kSenders) {
        intact = false;
        return;
      }
      const std::string blob = payload["blob"].asString();
      if (payload["seq"].asInt() != next_seq[static_cast<size_t>(sender)] || blob.size() != kBlobBytes ||
          blob.find_first_not_of(static_cast<char>('a' + sender)) != std::string::npos) {
        intact = false;
      }
      ++next_seq[static_cast<size_t>(sender)];
    });

    std::vector<std::thread> senders;
    for (int sender = 0; sender < kSenders; ++sender) {
      senders.emplace_back([&pair, sender] {
        for (int seq = 0; seq < kMessages; ++seq) {
          Json::Value payload(Json::objectValue);
          payload["sender"] = sender;
          payload["seq"] = seq;
          payload["blob"] = std::string(kBlobBytes, static_cast<char>('a' + sender));
          pair.left->Send("blob", payload);
        }
      });
    }
    std::thread closer([&] {
      for (auto& thread : senders) {
        thread.join();
      }
      pair.left->Close();
    });
    std::optional<tw::Error> run_error = Capture([&] { pair.right->Run(); });
    closer.join();

    Expect(!run_error, "Concurrent senders must never corrupt the frame stream");
    Expect(received == kSenders * kMessages, "Every concurrently sent event must arrive");
    Expect(intact, "Each event must arrive whole and in per-sender order");
  }

} // namespace

int main() {
  TestOrderedDelivery();
  TestTypedHandlersAndFallback();
  TestLastRegistrationWinsAndRemoval();
  TestPayloadMismatch();
  TestDefaultDecodeReportIsJson();
  TestMalformedFrames();
  TestEndOfStreamAndClose();
  TestCloseUnblocksReader();
  TestSendRaw();
  TestSendJSONSLogs();
  TestSendJSONSLogsDuplicateKeys();
  TestConcurrentLargeSends();
  std::cout << "event stream tests ok" << std::endl;
  return 0;
}
