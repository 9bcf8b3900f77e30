#include "tw/orchestrator/server.h"

#include <utility>
#include <vector>

#include "tw/common.h"
#include "tw/platform/fd_writer.h"
#include "tw/storage/io_util.h"

namespace tw::orchestrator {
namespace {

Error Wrap(std::string_view prefix, const Error& err) {
  return Error{err.domain, err.code, std::string(prefix) + ": " + err.what(), err.native_code,
               err.retryability, err.context};
}

} // namespace

Server::Server(ServerConfig config) : config_(std::move(config)) {}

Server::~Server() {
  if (started_.load(std::memory_order_acquire)) {
    Stop(std::nullopt);
  }
  failure_.Broadcast(std::nullopt);
  if (operator_watcher_.joinable()) {
    operator_watcher_.join();
  }
  if (failure_watcher_.joinable()) {
    failure_watcher_.join();
  }
  operators_.reset();
  state_.reset();
}

void Server::Start() {
  storage::EnsureDirectory(config_.dir, kDirPerms);

  std::vector<std::shared_ptr<core::Writer>> sinks;
  sinks.push_back(platform::FdWriter::OpenAppend(config_.dir / std::string(kLogFile), kFilePerms));
  sinks.push_back(config_.console ? config_.console : platform::FdWriter::Stdout());
  fanout_ = std::make_shared<core::FanoutWriter>(std::move(sinks));
  logger_.emplace(fanout_, config_.debug ? EventSeverity::kDebug : EventSeverity::kInfo);

  state_ = OpenState(config_.dir, config_.state_write_delay,
                     [this](const Error& err) { failure_.Broadcast(Wrap("persistent state", err)); });
  started_.store(true, std::memory_order_release);

  OperatorServerConfig op_config{config_.dir, *logger_, fanout_, state_.get(), config_.op_name_wait};
  operators_ = std::make_unique<OperatorServer>(std::move(op_config));
  try {
    operators_->Start();
  } catch (const Error& err) {
    Error wrapped = Wrap("starting operator service", err);
    Stop(wrapped);
    throw wrapped;
  }
  operator_watcher_ = std::thread([this] {
    if (auto err = operators_->Wait()) {
      failure_.Broadcast(Wrap("operator service", *err));
    }
  });
  failure_watcher_ = std::thread([this] { WatchForFailure(); });

  logger_->Info(lm::kServerReady, {{lk::kDirname, PathToUtf8String(config_.dir)}});
}

void Server::WatchForFailure() {
  if (auto err = failure_.Wait()) {
    Stop(std::move(err));
  }
}

std::optional<Error> Server::Stop(std::optional<Error> reason) {
  if (stopping_.exchange(true, std::memory_order_acq_rel)) {
    return Wait();
  }

  std::optional<Error> result = std::move(reason);
  if (operators_) {
    const std::string goodbye = result ? "Error: " + std::string(result->what()) : std::string();
    if (auto err = operators_->Stop(goodbye); err && !result) {
      result = Wrap("stopping operator service", *err);
    }
  }

  if (state_) {
    try {
      state_->Write();
    } catch (const Error& err) {
      if (logger_) {
        logger_->Error(lm::kStateWriteFailed, {ErrorField(err)});
      }
      if (!result) {
        result = Wrap("flushing state", err);
      }
    }
  }

  if (result && logger_) {
    logger_->Error(lm::kServerDied, {ErrorField(*result)});
  }
  failure_.Broadcast(std::nullopt);
  done_.Broadcast(std::move(result));
  return Wait();
}

std::optional<std::string> Server::CheckIn(const std::string& id, const std::string& from) {
  StateWriteGuard guard(*state_);
  const bool is_new = guard.Doc().Saw(id, from);
  std::optional<std::string> task = guard.Doc().NextTask(id);
  const size_t qlen = guard.Doc().QueueLength(id);
  guard.Unlock();

  if (is_new) {
    logger_->Info(lm::kNewImplant, {{lk::kId, id}, {lk::kFrom, from}});
  }
  if (task) {
    logger_->Info(lm::kTaskRequest, {{lk::kId, id}, {lk::kTask, *task}, {lk::kQLen, qlen}});
  } else {
    logger_->Debug(lm::kTaskRequest, {{lk::kId, id}, {lk::kQLen, qlen}});
  }
  return task;
}

} // namespace tw::orchestrator
