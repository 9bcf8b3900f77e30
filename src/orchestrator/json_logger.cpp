#include "tw/orchestrator/json_logger.h"

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "tw/common.h"
#include "tw/error.h"

namespace tw::orchestrator {

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "DEBUG";
  case EventSeverity::kInfo:
    return "INFO";
  case EventSeverity::kWarning:
    return "WARN";
  case EventSeverity::kError:
    return "ERROR";
  }
  return "INFO";
}

std::string BuildEventJson(const Event& event, std::chrono::system_clock::time_point when) {
  std::string payload;
  payload.reserve(128);
  payload += "{\"time\":\"";
  payload += FormatTimestamp(when);
  payload += "\",\"level\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"msg\":\"";
  payload += EscapeJson(event.message);
  payload += "\"";
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    switch (field.kind) {
    case FieldKind::kNumber:
    case FieldKind::kBool:
    case FieldKind::kJson:
      payload += field.value.empty() ? std::string("null") : field.value;
      break;
    case FieldKind::kString:
      payload += "\"";
      payload += EscapeJson(field.value);
      payload += "\"";
      break;
    }
  }
  payload += "}";
  return payload;
}

EventField ErrorField(const std::exception& err) {
  return EventField(kErrorKey, std::string(err.what()));
}

JsonLineLogger::JsonLineLogger(std::shared_ptr<core::Writer> sink, EventSeverity min_severity)
    : shared_(std::make_shared<Shared>()) {
  shared_->sink = std::move(sink);
  shared_->min_severity.store(static_cast<int>(min_severity), std::memory_order_relaxed);
}

void JsonLineLogger::Log(EventSeverity severity, std::string_view message,
                         std::vector<EventField> fields) const {
  if (!Enabled(severity)) {
    return;
  }
  Event event;
  event.severity = severity;
  event.message = std::string(message);
  event.fields = std::move(fields);
  Log(event);
}

void JsonLineLogger::Log(const Event& event) const {
  if (!Enabled(event.severity)) {
    return;
  }
  std::string line;
  if (bound_.empty()) {
    line = BuildEventJson(event, std::chrono::system_clock::now());
  } else {
    Event merged;
    merged.severity = event.severity;
    merged.message = event.message;
    merged.fields.reserve(bound_.size() + event.fields.size());
    merged.fields.insert(merged.fields.end(), bound_.begin(), bound_.end());
    merged.fields.insert(merged.fields.end(), event.fields.begin(), event.fields.end());
    line = BuildEventJson(merged, std::chrono::system_clock::now());
  }
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (!shared_->sink) {
    return;
  }
  try {
    shared_->sink->Write(std::string_view(line));
    if (shared_->dropped_streak > 0) {
      std::clog << "{\"event\":\"logger_recovered\",\"dropped\":" << shared_->dropped_streak << "}"
                << std::endl;
      shared_->dropped_streak = 0;
    }
  } catch (const std::exception& err) {
    ++shared_->dropped_streak;
    std::clog << "{\"event\":\"logger_error\",\"message\":\"log write failed\",\"detail\":\""
              << EscapeJson(err.what()) << "\"}" << std::endl;
  }
}

JsonLineLogger JsonLineLogger::With(std::vector<EventField> fields) const {
  JsonLineLogger derived = *this;
  derived.bound_.insert(derived.bound_.end(), std::make_move_iterator(fields.begin()),
                        std::make_move_iterator(fields.end()));
  return derived;
}

void JsonLineLogger::SetMinSeverity(EventSeverity severity) noexcept {
  shared_->min_severity.store(static_cast<int>(severity), std::memory_order_relaxed);
}

bool JsonLineLogger::Enabled(EventSeverity severity) const noexcept {
  return static_cast<int>(severity) >= shared_->min_severity.load(std::memory_order_relaxed);
}

} // namespace tw::orchestrator
