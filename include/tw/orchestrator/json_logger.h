#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "tw/core/io.h"

namespace tw::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug = 0, kInfo = 1, kWarning = 2, kError = 3 };

  enum class FieldKind { kString, kNumber, kBool, kJson };

  struct EventField {
    std::string key;
    std::string value;
    FieldKind kind{FieldKind::kString};

    EventField(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    EventField(std::string_view k, const char* v) : key(k), value(v ? v : "") {}
    EventField(std::string_view k, std::string_view v) : key(k), value(v) {}
    EventField(std::string_view k, bool v)
        : key(k), value(v ? "true" : "false"), kind(FieldKind::kBool) {}
    template <class N, std::enable_if_t<std::is_integral_v<N> && !std::is_same_v<N, bool>, int> = 0>
    EventField(std::string_view k, N v)
        : key(k), value(std::to_string(v)), kind(FieldKind::kNumber) {}

    // |json| must be a complete single-line JSON value.
    static EventField Json(std::string_view k, std::string json) {
      EventField field(k, std::move(json));
      field.kind = FieldKind::kJson;
      return field;
    }
  };

  struct Event {
    EventSeverity severity{EventSeverity::kInfo};
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  std::string EscapeJson(std::string_view text);

  // Renders one record: {"time":...,"level":...,"msg":...,<fields>}.
  std::string BuildEventJson(const Event& event, std::chrono::system_clock::time_point when);

  inline constexpr std::string_view kErrorKey{"error"};

  EventField ErrorField(const std::exception& err);

  // Writes one JSON object per line to a sink. Copies share the sink, the
  // severity threshold and the write lock; With() derives a copy whose bound
  // fields precede every record's own fields.
  class JsonLineLogger {
  public:
    explicit JsonLineLogger(std::shared_ptr<core::Writer> sink,
                            EventSeverity min_severity = EventSeverity::kInfo);

    void Log(const Event& event) const;
    void Log(EventSeverity severity, std::string_view message, std::vector<EventField> fields = {}) const;

    void Debug(std::string_view message, std::vector<EventField> fields = {}) const {
      Log(EventSeverity::kDebug, message, std::move(fields));
    }
    void Info(std::string_view message, std::vector<EventField> fields = {}) const {
      Log(EventSeverity::kInfo, message, std::move(fields));
    }
    void Warn(std::string_view message, std::vector<EventField> fields = {}) const {
      Log(EventSeverity::kWarning, message, std::move(fields));
    }
    void Error(std::string_view message, std::vector<EventField> fields = {}) const {
      Log(EventSeverity::kError, message, std::move(fields));
    }

    [[nodiscard]] JsonLineLogger With(std::vector<EventField> fields) const;

    void SetMinSeverity(EventSeverity severity) noexcept;
    [[nodiscard]] bool Enabled(EventSeverity severity) const noexcept;

  private:
    struct Shared {
      std::shared_ptr<core::Writer> sink;
      std::mutex mutex;
      std::atomic<int> min_severity;
      uint64_t dropped_streak{0};
    };

    std::shared_ptr<Shared> shared_;
    std::vector<EventField> bound_;
  };

} // namespace tw::orchestrator
