#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "tw/core/fanout_writer.h"
#include "tw/error.h"
#include "tw/orchestrator/defs.h"
#include "tw/orchestrator/error_latch.h"
#include "tw/orchestrator/json_logger.h"
#include "tw/orchestrator/operator_server.h"
#include "tw/orchestrator/state.h"

namespace tw::orchestrator {

  struct ServerConfig {
    std::filesystem::path dir{std::string(kDefaultDir)};
    bool debug{false};
    std::chrono::milliseconds state_write_delay{kStateWriteDelay};
    std::chrono::milliseconds op_name_wait{kOpNameWait};
    // Second permanent log sink besides log.json; standard output when unset.
    std::shared_ptr<core::Writer> console;
  };

  // Owns the working directory, the log fan-out, the persisted state and the
  // operator listener, and ties their failures to one shutdown path.
  class Server {
  public:
    explicit Server(ServerConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Creates the directory, starts logging, loads state and starts the
    // operator listener. A state load failure is thrown.
    void Start();

    // Says goodbye to operators ("Error: <reason>" when |reason| is set),
    // flushes state and records the result. Idempotent; later calls return
    // the first call's result.
    std::optional<Error> Stop(std::optional<Error> reason);

    // Blocks until Stop has finished.
    std::optional<Error> Wait() { return done_.Wait(); }

    // Implant check-in: records the sighting and pops the implant's next
    // task, if any.
    std::optional<std::string> CheckIn(const std::string& id, const std::string& from);

    [[nodiscard]] const JsonLineLogger& logger() const { return *logger_; }
    [[nodiscard]] StateManager& state() { return *state_; }
    [[nodiscard]] std::filesystem::path operator_socket() const { return config_.dir / std::string(kOpSock); }

  private:
    void WatchForFailure();

    const ServerConfig config_;
    // First background failure; std::nullopt once stopping. Declared before
    // state_ because the state's final flush may still report into it.
    ErrorLatch failure_;
    ErrorLatch done_;
    std::shared_ptr<core::FanoutWriter> fanout_;
    std::optional<JsonLineLogger> logger_;
    std::unique_ptr<StateManager> state_;
    std::unique_ptr<OperatorServer> operators_;

    std::thread operator_watcher_;
    std::thread failure_watcher_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
  };

} // namespace tw::orchestrator
