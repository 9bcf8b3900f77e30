#include "tw/orchestrator/operator_server.h"

#include <cerrno>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include "tw/common.h"
#include "tw/core/pipe.h"
#include "tw/errors.h"

namespace tw::orchestrator {
namespace {

// Shared between a connection's supervising thread and its receiving thread
// while the operator's first event is awaited.
struct NameExchange {
  enum class Phase { kInitial, kRunning, kAborted };

  std::mutex mutex;
  std::condition_variable cv;
  std::optional<std::string> name;
  std::optional<Error> error;
  bool first_event_done{false};
  Phase phase{Phase::kInitial};

  void Release(Phase next) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      phase = next;
    }
    cv.notify_all();
  }
};

// Runs |body| on its own thread. On destruction, calls |unblock| and joins,
// so an early exit from the owning scope never leaves the thread running.
class WorkerThread {
public:
  WorkerThread(std::function<void()> unblock, std::function<void()> body)
      : unblock_(std::move(unblock)), thread_(std::move(body)) {}

  ~WorkerThread() {
    if (thread_.joinable()) {
      unblock_();
      thread_.join();
    }
  }

  WorkerThread(const WorkerThread&) = delete;
  WorkerThread& operator=(const WorkerThread&) = delete;

  void Join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::function<void()> unblock_;
  std::thread thread_;
};

Error FromException(const std::exception& ex) {
  return Error{ErrorDomain::Internal, errors::internal::kUnexpected, ex.what()};
}

std::string ErrorType(const Error& err) {
  return std::string(ErrorDomainName(err.domain)) + ":" + std::to_string(err.code);
}

bool IsResourceExhaustion(const Error& err) {
  return err.domain == ErrorDomain::IO && err.code == errors::io::kAcceptFailed && err.native_code &&
         (*err.native_code == EMFILE || *err.native_code == ENFILE);
}

} // namespace

OperatorServer::OperatorServer(OperatorServerConfig config) : config_(std::move(config)) {}

OperatorServer::~OperatorServer() {
  if (started_.load(std::memory_order_acquire) && !stopped_.load(std::memory_order_acquire)) {
    Stop("");
  }
}

std::filesystem::path OperatorServer::socket_path() const {
  return config_.dir / std::string(kOpSock);
}

size_t OperatorServer::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(conns_mutex_);
  return conns_ ? conns_->size() : 0;
}

void OperatorServer::Start() {
  if (!config_.fanout || config_.state == nullptr) {
    throw Error{ErrorDomain::Config, 0, "operator server needs a log fanout and a state manager"};
  }
  {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    conns_.emplace();
  }

  const auto path = socket_path();
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kSocketFailed,
                "removing existing operator socket " + PathToUtf8String(path) + ": " + ec.message(),
                ec.value()};
  }
  listener_ = platform::UnixListener::Listen(path);
  config_.logger.Debug(lm::kOpListening, {{lk::kAddress, PathToUtf8String(path)}});

  accept_thread_ = std::thread([this] { AcceptLoop(); });
  started_.store(true, std::memory_order_release);
}

std::optional<Error> OperatorServer::Stop(std::string_view message) {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return Wait();
  }
  if (listener_) {
    listener_->Close();
  }

  std::set<std::shared_ptr<OperatorConn>> current;
  {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    if (conns_) {
      current = std::move(*conns_);
    }
    conns_.reset();
  }

  std::vector<std::thread> goodbyes;
  goodbyes.reserve(current.size());
  for (const auto& conn : current) {
    goodbyes.emplace_back([conn, text = std::string(message)] { conn->Goodbye(text); });
  }
  for (auto& goodbye : goodbyes) {
    goodbye.join();
  }

  // The accept loop must be gone before the handler count can only fall.
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    std::unique_lock<std::mutex> lock(conns_mutex_);
    conns_cv_.wait(lock, [&] { return handlers_running_ == 0; });
  }

  latch_.Broadcast(std::nullopt);
  return Wait();
}

void OperatorServer::AcceptLoop() {
  for (;;) {
    std::shared_ptr<core::Conn> accepted;
    try {
      if (config_.before_accept) {
        config_.before_accept();
      }
      accepted = listener_->Accept();
    } catch (const Error& err) {
      if (err.domain == ErrorDomain::IO && err.code == errors::io::kListenerClosed) {
        return;
      }
      if (IsResourceExhaustion(err)) {
        config_.logger.Warn(lm::kTemporaryAcceptError, {ErrorField(err)});
        std::this_thread::sleep_for(config_.accept_wait);
        continue;
      }
      latch_.Broadcast(Error{err.domain, err.code, "accept: " + std::string(err.what()), err.native_code,
                             err.retryability, err.context});
      return;
    }

    {
      std::lock_guard<std::mutex> lock(conns_mutex_);
      ++handlers_running_;
    }
    try {
      std::thread([this, conn = std::move(accepted)]() mutable {
        HandleConn(std::move(conn));
        std::lock_guard<std::mutex> lock(conns_mutex_);
        --handlers_running_;
        conns_cv_.notify_all();
      }).detach();
    } catch (const std::system_error& err) {
      {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        --handlers_running_;
      }
      conns_cv_.notify_all();
      accepted->Close();
      config_.logger.Warn(lm::kTemporaryAcceptError, {ErrorField(err)});
      std::this_thread::sleep_for(config_.accept_wait);
    }
  }
}

void OperatorServer::HandleConn(std::shared_ptr<core::Conn> raw) {
  const uint64_t cnum = cnum_.fetch_add(1, std::memory_order_acq_rel) + 1;
  auto conn = std::make_shared<OperatorConn>(std::move(raw), cnum, config_.logger, *config_.state);

  {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    if (!conns_) {
      conn->Close();
      return;
    }
    conns_->insert(conn);
  }

  try {
    RunConnection(*conn);
  } catch (const Error& err) {
    conn->Log(EventSeverity::kError, lm::kOpDisconnected, {ErrorField(err), {lk::kErrorType, ErrorType(err)}});
  } catch (const std::exception& ex) {
    conn->Log(EventSeverity::kError, lm::kOpDisconnected, {ErrorField(ex), {lk::kErrorType, "internal"}});
  }

  conn->Close();
  std::lock_guard<std::mutex> lock(conns_mutex_);
  if (conns_) {
    conns_->erase(conn);
  }
}

void OperatorServer::RunConnection(OperatorConn& conn) {
  auto& stream = conn.stream();
  NameExchange exchange;
  ErrorLatch ended;

  // Until the operator names itself only "name" is acceptable.
  stream.AddHandler<Json::Value>("", [&exchange](const std::string& event, const Json::Value&) {
    std::lock_guard<std::mutex> lock(exchange.mutex);
    exchange.error = Error{ErrorDomain::Protocol, errors::protocol::kUnexpectedEvent,
                           std::string(errors::msg::kUnexpectedEvent) + " \"" + event + "\""};
  });
  stream.AddHandler<std::string>(std::string(event::kName), [&exchange](const std::string&, std::string name) {
    std::lock_guard<std::mutex> lock(exchange.mutex);
    exchange.name = std::move(name);
  });

  WorkerThread receiver(
      [&] {
        exchange.Release(NameExchange::Phase::kAborted);
        conn.Close();
      },
      [&] {
        bool ended_early = false;
        std::optional<Error> failure;
        try {
          ended_early = !stream.RunOnce();
        } catch (const Error& err) {
          ended_early = true;
          failure = err;
        } catch (const std::exception& ex) {
          ended_early = true;
          failure = FromException(ex);
        }

        {
          std::unique_lock<std::mutex> lock(exchange.mutex);
          if (ended_early && !exchange.error) {
            exchange.error = failure ? *failure
                                     : Error{ErrorDomain::IO, errors::io::kStreamClosed,
                                             std::string(errors::msg::kEndOfStream)};
          }
          exchange.first_event_done = true;
          exchange.cv.notify_all();
          exchange.cv.wait(lock, [&] { return exchange.phase != NameExchange::Phase::kInitial; });
          if (exchange.phase == NameExchange::Phase::kAborted) {
            return;
          }
        }

        if (ended_early) {
          ended.Broadcast(failure);
          return;
        }
        std::optional<Error> result;
        try {
          stream.Run([&conn](const Error& err) {
            conn.Log(EventSeverity::kWarning, lm::kDecodeError, {ErrorField(err)});
          });
        } catch (const Error& err) {
          result = err;
        } catch (const std::exception& ex) {
          result = FromException(ex);
        }
        ended.Broadcast(std::move(result));
      });

  std::optional<std::string> name;
  {
    std::unique_lock<std::mutex> lock(exchange.mutex);
    exchange.cv.wait_for(lock, config_.name_wait, [&] { return exchange.first_event_done; });
    if (exchange.first_event_done && exchange.error) {
      const Error err = *exchange.error;
      lock.unlock();
      conn.Log(EventSeverity::kInfo, lm::kOpInitialNameError, {ErrorField(err)});
      return;
    }
    name = exchange.name;
  }
  if (!name) {
    name = "cnum-" + std::to_string(conn.cnum());
    conn.Log(EventSeverity::kInfo, lm::kOpInitialNameError,
             {{kErrorKey, errors::msg::kNameTimeout}, {lk::kOpName, *name}});
  }
  conn.SetName(std::move(*name));
  conn.InstallHandlers();

  // Tap the log into this operator's stream.
  auto pipe = core::MakePipe();
  config_.fanout->Add(pipe.writer);
  WorkerThread drain(
      [&pipe] {
        pipe.reader->Close();
        pipe.writer->Close();
      },
      [&] {
        std::optional<Error> result;
        try {
          stream.SendJSONSLogs(*pipe.reader);
        } catch (const Error& err) {
          result = err;
        } catch (const std::exception& ex) {
          result = FromException(ex);
        }
        ended.Broadcast(result);
        pipe.writer->CloseWithError(result);
      });

  exchange.Release(NameExchange::Phase::kRunning);
  conn.Log(EventSeverity::kInfo, lm::kOpConnected);

  const std::optional<Error> result = ended.Wait();
  if (!result || IsDisconnect(*result)) {
    conn.Log(EventSeverity::kInfo, lm::kOpDisconnected);
  } else {
    conn.Log(EventSeverity::kError, lm::kOpDisconnected,
             {ErrorField(*result), {lk::kErrorType, ErrorType(*result)}});
  }

  config_.fanout->Remove(pipe.writer);
  pipe.writer->Close();
  pipe.reader->Close();
  conn.Close();
  drain.Join();
  receiver.Join();
}

} // namespace tw::orchestrator
