#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tw/core/event_stream.h"
#include "tw/orchestrator/json_logger.h"
#include "tw/orchestrator/protocol.h"
#include "tw/orchestrator/state.h"

namespace tw::orchestrator {

  // One operator's connection: its event stream, its (changeable) name and
  // the handlers serving its requests.
  class OperatorConn {
  public:
    OperatorConn(std::shared_ptr<core::Conn> conn, uint64_t cnum, JsonLineLogger logger,
                 StateManager& state);

    core::EventStream& stream() noexcept { return stream_; }
    [[nodiscard]] uint64_t cnum() const noexcept { return cnum_; }

    // Returns the previous name, if there was one.
    std::optional<std::string> SetName(std::string name);
    [[nodiscard]] std::optional<std::string> name() const;

    // Replaces the stream's handlers with the steady-state set.
    void InstallHandlers();

    // Best effort: sends the goodbye event, then closes the stream.
    void Goodbye(std::string_view message);
    void Close() { stream_.Close(); }

    // Logs with the connection number and, once known, the operator's name.
    void Log(EventSeverity severity, std::string_view message, std::vector<EventField> fields = {}) const;

  private:
    void HandleDefault(const std::string& event, const Json::Value& payload);
    void HandleName(const std::string& event, std::string name);
    void HandleEnqueue(const std::string& event, EnqueueRequest request);
    void HandleListSeen(const std::string& event);

    core::EventStream stream_;
    const uint64_t cnum_;
    JsonLineLogger logger_;
    StateManager& state_;

    mutable std::mutex name_mutex_;
    std::optional<std::string> name_;
  };

} // namespace tw::orchestrator
