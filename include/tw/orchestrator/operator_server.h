#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>

#include "tw/core/fanout_writer.h"
#include "tw/error.h"
#include "tw/orchestrator/defs.h"
#include "tw/orchestrator/error_latch.h"
#include "tw/orchestrator/json_logger.h"
#include "tw/orchestrator/operator_conn.h"
#include "tw/orchestrator/state.h"
#include "tw/platform/unix_socket.h"

namespace tw::orchestrator {

  struct OperatorServerConfig {
    std::filesystem::path dir;
    JsonLineLogger logger;
    // Log records are tapped from here into each operator's stream.
    std::shared_ptr<core::FanoutWriter> fanout;
    StateManager* state{nullptr};
    std::chrono::milliseconds name_wait{kOpNameWait};
    std::chrono::milliseconds accept_wait{kAcceptWait};
    // Called before every accept; an exception it throws is handled as if
    // Accept had thrown it.
    std::function<void()> before_accept;
  };

  // Listens on <dir>/op.sock and serves one OperatorConn per accepted
  // connection.
  class OperatorServer {
  public:
    explicit OperatorServer(OperatorServerConfig config);
    ~OperatorServer();

    OperatorServer(const OperatorServer&) = delete;
    OperatorServer& operator=(const OperatorServer&) = delete;

    // Removes a stale socket file, listens and starts accepting.
    void Start();

    // Closes the listener, says goodbye with |message| to every connected
    // operator and waits for every connection to finish. Returns the result
    // Wait() returns. Idempotent.
    std::optional<Error> Stop(std::string_view message);

    // Blocks until the server has stopped or failed. std::nullopt means a
    // clean stop.
    std::optional<Error> Wait() { return latch_.Wait(); }

    [[nodiscard]] std::filesystem::path socket_path() const;
    [[nodiscard]] size_t ConnectionCount() const;

  private:
    void AcceptLoop();
    void HandleConn(std::shared_ptr<core::Conn> conn);
    void RunConnection(OperatorConn& conn);

    OperatorServerConfig config_;
    std::unique_ptr<platform::UnixListener> listener_;
    std::thread accept_thread_;
    std::atomic<uint64_t> cnum_{0};

    mutable std::mutex conns_mutex_;
    std::condition_variable conns_cv_;
    // std::nullopt once shutdown has begun; no more connections are taken.
    std::optional<std::set<std::shared_ptr<OperatorConn>>> conns_;
    size_t handlers_running_{0};

    ErrorLatch latch_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
  };

} // namespace tw::orchestrator
