#include "tw/orchestrator/operator_conn.h"

#include <utility>

#include "tw/errors.h"
#include "tw/orchestrator/defs.h"

namespace tw::orchestrator {

OperatorConn::OperatorConn(std::shared_ptr<core::Conn> conn, uint64_t cnum, JsonLineLogger logger,
                           StateManager& state)
    : stream_(std::move(conn)),
      cnum_(cnum),
      logger_(logger.With({{lk::kConnNumber, cnum}})),
      state_(state) {}

std::optional<std::string> OperatorConn::SetName(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  std::optional<std::string> old = std::move(name_);
  name_ = std::move(name);
  return old;
}

std::optional<std::string> OperatorConn::name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return name_;
}

void OperatorConn::Log(EventSeverity severity, std::string_view message,
                       std::vector<EventField> fields) const {
  if (!logger_.Enabled(severity)) {
    return;
  }
  if (auto current = name()) {
    fields.insert(fields.begin(), EventField(lk::kOpName, std::move(*current)));
  }
  logger_.Log(severity, message, std::move(fields));
}

void OperatorConn::InstallHandlers() {
  stream_.AddHandler<Json::Value>(
      "", [this](const std::string& event, const Json::Value& payload) { HandleDefault(event, payload); });
  stream_.AddHandler<std::string>(std::string(event::kName),
                                  [this](const std::string& event, std::string name) {
                                    HandleName(event, std::move(name));
                                  });
  stream_.AddHandler<EnqueueRequest>(std::string(event::kEnqueue),
                                     [this](const std::string& event, EnqueueRequest request) {
                                       HandleEnqueue(event, std::move(request));
                                     });
  stream_.AddHandler<Json::Value>(std::string(event::kListSeen),
                                  [this](const std::string& event, const Json::Value&) { HandleListSeen(event); });
}

void OperatorConn::Goodbye(std::string_view message) {
  try {
    stream_.Send(event::kGoodbye, orchestrator::Goodbye{std::string(message)});
  } catch (const tw::Error& err) {
    Log(EventSeverity::kDebug, lm::kOpDisconnected, {ErrorField(err)});
  }
  stream_.Close();
}

void OperatorConn::HandleDefault(const std::string& event, const Json::Value& payload) {
  Log(EventSeverity::kWarning, lm::kUnexpectedMessage,
      {{lk::kMessageType, event}, EventField::Json(lk::kMessage, core::ToJsonLine(payload))});
}

void OperatorConn::HandleName(const std::string&, std::string name) {
  auto old = SetName(std::move(name));
  Log(EventSeverity::kInfo, lm::kOpNameChange, {{lk::kOpOldName, old.value_or(std::string())}});
}

void OperatorConn::HandleEnqueue(const std::string& event, EnqueueRequest request) {
  if (request.id.empty()) {
    request.error = std::string(errors::msg::kIdMissing);
    stream_.Send(event, request);
    return;
  }
  if (request.task.empty()) {
    request.error = std::string(errors::msg::kEmptyTask);
    stream_.Send(event, request);
    return;
  }

  StateWriteGuard guard(state_);
  const size_t qlen = guard.Doc().Enqueue(request.id, request.task);
  try {
    guard.UnlockAndWrite();
  } catch (const tw::Error& err) {
    // Already forwarded to the manager's error callback; the task stays queued
    // in memory.
    Log(EventSeverity::kError, lm::kStateWriteFailed, {ErrorField(err)});
  }

  Log(EventSeverity::kInfo, lm::kTaskQueued,
      {{lk::kId, request.id}, {lk::kTask, request.task}, {lk::kQLen, qlen}});
}

void OperatorConn::HandleListSeen(const std::string&) {
  std::vector<SeenImplant> seen;
  {
    StateReadGuard guard(state_);
    seen = guard.Doc().last_seen;
  }

  stream_.Send(event::kListSeen, seen);
  Log(EventSeverity::kDebug, lm::kSentSeenList);
}

} // namespace tw::orchestrator
