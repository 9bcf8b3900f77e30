#include "tw/core/event_stream.h"

#include <array>
#include <iostream>

#include "tw/errors.h"

namespace tw::core {
namespace detail {

std::optional<std::string> LineReader::ReadLine() {
  for (;;) {
    auto newline = buffer_.find('\n');
    if (newline != std::string::npos) {
      if (newline > max_line_) {
        throw Error{ErrorDomain::Protocol, errors::protocol::kFrameTooLong,
                    std::string(errors::msg::kFrameTooLong)};
      }
      std::string line = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      return line;
    }
    if (buffer_.size() > max_line_) {
      throw Error{ErrorDomain::Protocol, errors::protocol::kFrameTooLong,
                  std::string(errors::msg::kFrameTooLong)};
    }
    if (eof_) {
      if (buffer_.empty()) {
        return std::nullopt;
      }
      std::string line;
      line.swap(buffer_);
      return line;
    }
    std::array<uint8_t, 4096> chunk{};
    const size_t got = source_.Read(std::span<uint8_t>(chunk.data(), chunk.size()));
    if (got == 0) {
      eof_ = true;
      continue;
    }
    buffer_.append(reinterpret_cast<const char*>(chunk.data()), got);
  }
}

} // namespace detail

namespace {

bool IsBlank(std::string_view line) {
  return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

std::string_view TrimTrailing(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }
  return line;
}

Error WithEventName(const Error& err, const std::string& name) {
  return Error{err.domain, err.code, "event \"" + name + "\": " + err.what(), err.native_code,
               err.retryability, err.context};
}

} // namespace

EventStream::EventStream(std::shared_ptr<Conn> conn, size_t max_frame)
    : conn_(std::move(conn)), lines_(*conn_, max_frame) {}

EventStream::~EventStream() { Close(); }

void EventStream::SetDispatcher(std::string name, Dispatcher dispatcher) {
  auto shared = std::make_shared<const Dispatcher>(std::move(dispatcher));
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[std::move(name)] = std::move(shared);
}

void EventStream::RemoveHandler(const std::string& name) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(name);
}

void EventStream::ThrowClosed() const {
  throw Error{ErrorDomain::IO, errors::io::kStreamClosed, std::string(errors::msg::kStreamClosed)};
}

void EventStream::WriteFrame(std::string_view name, std::string_view payload_line) {
  std::string frame = ToJsonLine(Json::Value(std::string(name)));
  frame.reserve(frame.size() + payload_line.size() + 2);
  frame.push_back('\n');
  frame.append(payload_line);
  frame.push_back('\n');

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed()) {
    ThrowClosed();
  }
  try {
    conn_->Write(std::string_view(frame));
  } catch (const Error&) {
    if (closed()) {
      ThrowClosed();
    }
    throw;
  }
}

void EventStream::SendRaw(std::string_view name, std::string_view json) {
  json = TrimTrailing(json);
  const Json::Value parsed =
      ParseJson(json, errors::protocol::kMalformedFrame, errors::msg::kInvalidPayloadJson);
  if (json.find('\n') != std::string_view::npos) {
    // Valid but multi-line; re-render so it fits on the payload line.
    WriteFrame(name, ToJsonLine(parsed));
    return;
  }
  WriteFrame(name, json);
}

bool EventStream::RunOnce() {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (closed()) {
    ThrowClosed();
  }

  std::optional<std::string> name_line;
  std::optional<std::string> payload_line;
  try {
    do {
      name_line = lines_.ReadLine();
    } while (name_line && IsBlank(*name_line));
    if (!name_line) {
      if (closed()) {
        ThrowClosed();
      }
      return false;
    }
    payload_line = lines_.ReadLine();
  } catch (const Error& err) {
    if (closed() && err.domain == ErrorDomain::IO) {
      ThrowClosed();
    }
    throw;
  }
  if (!payload_line) {
    if (closed()) {
      ThrowClosed();
    }
    throw Error{ErrorDomain::Protocol, errors::protocol::kMalformedFrame,
                std::string(errors::msg::kTruncatedMessage)};
  }

  const Json::Value name_value =
      ParseJson(*name_line, errors::protocol::kMalformedFrame, errors::msg::kNameNotString);
  if (!name_value.isString()) {
    throw Error{ErrorDomain::Protocol, errors::protocol::kMalformedFrame,
                std::string(errors::msg::kNameNotString)};
  }
  const std::string name = name_value.asString();
  const Json::Value payload =
      ParseJson(*payload_line, errors::protocol::kMalformedFrame, errors::msg::kInvalidPayloadJson);

  std::shared_ptr<const Dispatcher> dispatcher;
  {
    std::lock_guard<std::mutex> handlers_lock(handlers_mutex_);
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
      it = handlers_.find(std::string_view{});
    }
    if (it != handlers_.end()) {
      dispatcher = it->second;
    }
  }
  if (!dispatcher) {
    return true;
  }

  try {
    (*dispatcher)(name, payload);
  } catch (const Error& err) {
    if (err.domain == ErrorDomain::Protocol && err.code == errors::protocol::kPayloadMismatch) {
      throw WithEventName(err, name);
    }
    throw;
  }
  return true;
}

void EventStream::Run(const DecodeErrorHandler& on_decode_error) {
  for (;;) {
    try {
      if (!RunOnce()) {
        return;
      }
    } catch (const Error& err) {
      if (err.domain != ErrorDomain::Protocol || err.code != errors::protocol::kPayloadMismatch) {
        throw;
      }
      if (on_decode_error) {
        on_decode_error(err);
      } else {
        std::clog << "{\"event\":\"estream_error\",\"message\":\"payload decode failed\",\"detail\":"
                  << ToJsonLine(Json::Value(err.what())) << "}" << std::endl;
      }
    }
  }
}

void EventStream::SendJSONSLogs(Reader& source) {
  detail::LineReader records(source, kMaxFrameBytes);
  for (;;) {
    auto line = records.ReadLine();
    if (!line) {
      return;
    }
    std::string_view record = TrimTrailing(*line);
    if (IsBlank(record)) {
      continue;
    }
    const Json::Value parsed =
        ParseJson(record, errors::protocol::kMalformedFrame, errors::msg::kLogRecordNotObject);
    if (!parsed.isObject()) {
      throw Error{ErrorDomain::Protocol, errors::protocol::kMalformedFrame,
                  std::string(errors::msg::kLogRecordNotObject)};
    }
    const Json::Value& msg = parsed["msg"];
    if (!msg.isString()) {
      throw Error{ErrorDomain::Protocol, errors::protocol::kMalformedFrame,
                  std::string(errors::msg::kLogRecordMissingMsg)};
    }
    WriteFrame(msg.asString(), record);
  }
}

void EventStream::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  conn_->Close();
}

} // namespace tw::core
