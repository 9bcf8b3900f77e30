#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <pthread.h>
#include <signal.h>

#include "tw/common.h"
#include "tw/error.h"
#include "tw/errors.h"
#include "tw/orchestrator/defs.h"
#include "tw/orchestrator/server.h"
#include "tw/orchestrator/state.h"
#include "tw/storage/io_util.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitSoftware = 70;
  constexpr int kExitIO = 74;

  constexpr std::string_view kStateWriteDelayEnv{"TW_STATE_WRITE_DELAY_MS"};

  void PrintUsage() {
    std::cerr << "Usage:\n";
    std::cerr << "  taskwired [--dir=<path>] [--debug] [--state-write-delay=<ms>]\n";
    std::cerr << "  taskwired [--dir=<path>] --task=<id> <task...>\n";
    std::cerr << "\nFlags:\n";
    std::cerr << "  --dir=<path>             Working directory (default " << tw::orchestrator::kDefaultDir
              << ")\n";
    std::cerr << "  --debug                  Enable debug logging\n";
    std::cerr << "  --state-write-delay=<ms> Coalesce state writes for this long (default "
              << tw::orchestrator::kStateWriteDelay.count() << ", env " << kStateWriteDelayEnv << ")\n";
    std::cerr << "  --task=<id>              Queue the remaining arguments as a task for <id> and exit\n";
  }

  std::optional<std::chrono::milliseconds> ParseMillis(std::string_view value) {
    if (value.empty()) {
      return std::nullopt;
    }
    unsigned long long parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(parsed));
  }

  int ExitCodeFor(const tw::Error& err) {
    switch (err.domain) {
    case tw::ErrorDomain::IO:
      return kExitIO;
    case tw::ErrorDomain::Validation:
    case tw::ErrorDomain::Config:
      return kExitUsage;
    case tw::ErrorDomain::State:
    case tw::ErrorDomain::Protocol:
    case tw::ErrorDomain::Crypto:
    case tw::ErrorDomain::Internal:
    default:
      return kExitSoftware;
    }
  }

  void ReportError(const tw::Error& err) {
    std::cerr << tw::ErrorDomainName(err.domain) << " error: " << err.what() << '\n';
    for (const auto& frame : err.context) {
      std::cerr << "  while " << frame << '\n';
    }
  }

  int QueueTask(const std::filesystem::path& dir, const std::string& id, const std::string& task) {
    if (id.empty()) {
      std::cerr << "Validation error: " << tw::errors::msg::kIdMissing << '\n';
      return kExitUsage;
    }
    if (task.empty()) {
      std::cerr << "Validation error: " << tw::errors::msg::kEmptyTask << '\n';
      return kExitUsage;
    }
    tw::storage::EnsureDirectory(dir, tw::orchestrator::kDirPerms);
    auto state = tw::orchestrator::OpenState(dir, std::chrono::milliseconds(0), nullptr);
    tw::orchestrator::StateWriteGuard guard(*state);
    const size_t qlen = guard.Doc().Enqueue(id, task);
    guard.UnlockAndWrite();
    std::cout << "Queued task for " << id << " (queue length " << qlen << ")" << std::endl;
    return kExitOk;
  }

  std::string SignalName(int signo) {
    switch (signo) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal " + std::to_string(signo);
    }
  }

  // Waits for SIGINT or SIGTERM on a dedicated thread. SIGUSR1 only wakes the
  // thread so that it can be joined.
  class SignalWatcher {
  public:
    SignalWatcher() {
      sigemptyset(&set_);
      sigaddset(&set_, SIGINT);
      sigaddset(&set_, SIGTERM);
      sigaddset(&set_, SIGUSR1);
      const int rc = pthread_sigmask(SIG_BLOCK, &set_, nullptr);
      if (rc != 0) {
        throw tw::Error{tw::ErrorDomain::Internal, tw::errors::internal::kUnexpected,
                        std::string("pthread_sigmask: ") + std::strerror(rc), rc};
      }
    }

    ~SignalWatcher() {
      if (thread_.joinable()) {
        if (!done_.load(std::memory_order_acquire)) {
          pthread_kill(thread_.native_handle(), SIGUSR1);
        }
        thread_.join();
      }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void Start(tw::orchestrator::Server& server) {
      thread_ = std::thread([this, &server] {
        int signo = 0;
        while (sigwait(&set_, &signo) != 0) {
        }
        done_.store(true, std::memory_order_release);
        if (signo == SIGUSR1) {
          return;
        }
        server.logger().Info(tw::orchestrator::lm::kCaughtSignal,
                             {{tw::orchestrator::lk::kSignal, SignalName(signo)}});
        server.Stop(std::nullopt);
      });
    }

  private:
    sigset_t set_{};
    std::thread thread_;
    std::atomic<bool> done_{false};
  };

} // namespace

int main(int argc, char** argv) {
  try {
    tw::orchestrator::ServerConfig config;
    if (const char* env = std::getenv(kStateWriteDelayEnv.data())) {
      auto delay = ParseMillis(env);
      if (!delay) {
        std::cerr << "Configuration error: invalid " << kStateWriteDelayEnv << ": " << env << '\n';
        return kExitUsage;
      }
      config.state_write_delay = *delay;
    }

    std::optional<std::string> task_id;
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--") {
        ++index;
        break;
      }
      if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return kExitOk;
      }
      if (arg == "--debug") {
        config.debug = true;
        continue;
      }
      if (arg.rfind("--dir=", 0) == 0) {
        auto value = arg.substr(std::string_view("--dir=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        config.dir = std::filesystem::path(std::string(value));
        continue;
      }
      if (arg.rfind("--state-write-delay=", 0) == 0) {
        auto delay = ParseMillis(arg.substr(std::string_view("--state-write-delay=").size()));
        if (!delay) {
          PrintUsage();
          return kExitUsage;
        }
        config.state_write_delay = *delay;
        continue;
      }
      if (arg.rfind("--task=", 0) == 0) {
        task_id = std::string(arg.substr(std::string_view("--task=").size()));
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }

    if (task_id) {
      std::string task;
      for (int i = index; i < argc; ++i) {
        if (!task.empty()) {
          task += ' ';
        }
        task += argv[i];
      }
      return QueueTask(config.dir, *task_id, task);
    }
    if (index != argc) {
      PrintUsage();
      return kExitUsage;
    }

    tw::orchestrator::Server server(config);
    // Blocks the signals before Start spawns threads, so every thread
    // inherits the mask.
    SignalWatcher signals;
    server.Start();
    signals.Start(server);

    if (auto err = server.Wait()) {
      ReportError(*err);
      return ExitCodeFor(*err);
    }
    return kExitOk;
  } catch (const tw::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "Internal error: " << err.what() << std::endl;
    return kExitSoftware;
  }
}
