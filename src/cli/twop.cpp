#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "tw/common.h"
#include "tw/core/event_stream.h"
#include "tw/core/json_codec.h"
#include "tw/error.h"
#include "tw/orchestrator/defs.h"
#include "tw/orchestrator/protocol.h"
#include "tw/orchestrator/state.h"
#include "tw/platform/unix_socket.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitSoftware = 70;
  constexpr int kExitIO = 74;

  namespace orch = tw::orchestrator;

  void PrintUsage() {
    std::cerr << "Usage:\n";
    std::cerr << "  twop [--dir=<path>] [--name=<name>] enqueue <id> <task...>\n";
    std::cerr << "  twop [--dir=<path>] [--name=<name>] list\n";
    std::cerr << "  twop [--dir=<path>] [--name=<name>] watch\n";
    std::cerr << "\nThe name defaults to $USER.\n";
  }

  int ExitCodeFor(const tw::Error& err) {
    switch (err.domain) {
    case tw::ErrorDomain::IO:
      return kExitIO;
    case tw::ErrorDomain::Validation:
    case tw::ErrorDomain::Config:
      return kExitUsage;
    default:
      return kExitSoftware;
    }
  }

  // One command's conversation with the server. Handlers run on the thread
  // calling Run and set |done_| once the command has its answer.
  class Session {
  public:
    Session(const std::filesystem::path& dir, std::string name)
        : stream_(tw::platform::UnixConn::Dial(dir / std::string(orch::kOpSock))), name_(std::move(name)) {
      stream_.AddHandler<orch::Goodbye>(std::string(orch::event::kGoodbye),
                                        [this](const std::string&, const orch::Goodbye& goodbye) {
                                          if (goodbye.message.empty()) {
                                            std::cout << "Server said goodbye" << std::endl;
                                          } else {
                                            std::cout << "Server said goodbye: " << goodbye.message << std::endl;
                                          }
                                          done_ = true;
                                        });
    }

    int Enqueue(const std::string& id, const std::string& task) {
      stream_.AddHandler<orch::EnqueueRequest>(
          std::string(orch::event::kEnqueue), [&](const std::string&, const orch::EnqueueRequest& reply) {
            if (reply.id == id && reply.task == task && !reply.error.empty()) {
              std::cerr << "Error queueing task: " << reply.error << std::endl;
              exit_code_ = kExitSoftware;
              done_ = true;
            }
          });
      stream_.AddHandler<orch::TaskQueued>(std::string(orch::lm::kTaskQueued),
                                           [&](const std::string&, const orch::TaskQueued& queued) {
                                             if (queued.id == id && queued.task == task &&
                                                 queued.opname == name_) {
                                               std::cout << "Queued task for " << queued.id << " (queue length "
                                                         << queued.qlen << ")" << std::endl;
                                               done_ = true;
                                             }
                                           });
      Hello();
      stream_.Send(orch::event::kEnqueue, orch::EnqueueRequest{id, task, ""});
      return Run();
    }

    int List() {
      stream_.AddHandler<std::vector<orch::SeenImplant>>(
          std::string(orch::event::kListSeen),
          [this](const std::string&, const std::vector<orch::SeenImplant>& seen) {
            if (seen.empty()) {
              std::cout << "No implants seen" << std::endl;
            }
            for (const auto& implant : seen) {
              std::cout << tw::FormatTimestamp(implant.when) << ' ' << implant.id << ' ' << implant.from
                        << std::endl;
            }
            done_ = true;
          });
      Hello();
      stream_.Send(orch::event::kListSeen, Json::Value());
      return Run();
    }

    int Watch() {
      stream_.AddHandler<Json::Value>("", [](const std::string& event, const Json::Value& payload) {
        std::cout << tw::core::ToJsonLine(Json::Value(event)) << ' ' << tw::core::ToJsonLine(payload)
                  << std::endl;
      });
      Hello();
      return Run();
    }

  private:
    void Hello() { stream_.Send(orch::event::kName, name_); }

    int Run() {
      while (!done_) {
        if (!stream_.RunOnce()) {
          std::cerr << "Server closed the connection" << std::endl;
          return exit_code_ == kExitOk ? kExitIO : exit_code_;
        }
      }
      stream_.Close();
      return exit_code_;
    }

    tw::core::EventStream stream_;
    const std::string name_;
    bool done_{false};
    int exit_code_{kExitOk};
  };

} // namespace

int main(int argc, char** argv) {
  try {
    std::filesystem::path dir{std::string(orch::kDefaultDir)};
    std::string name;
    if (const char* user = std::getenv("USER")) {
      name = user;
    }

    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--help") {
        PrintUsage();
        return kExitOk;
      }
      if (arg.rfind("--dir=", 0) == 0) {
        auto value = arg.substr(std::string_view("--dir=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        dir = std::filesystem::path(std::string(value));
        continue;
      }
      if (arg.rfind("--name=", 0) == 0) {
        name = std::string(arg.substr(std::string_view("--name=").size()));
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    if (name.empty()) {
      std::cerr << "Configuration error: no operator name; set $USER or pass --name=" << std::endl;
      return kExitUsage;
    }

    const std::string cmd = argv[index++];
    if (cmd == "enqueue") {
      if (argc - index < 2) {
        PrintUsage();
        return kExitUsage;
      }
      const std::string id = argv[index++];
      std::string task;
      for (; index < argc; ++index) {
        if (!task.empty()) {
          task += ' ';
        }
        task += argv[index];
      }
      Session session(dir, name);
      return session.Enqueue(id, task);
    }
    if (cmd == "list") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      Session session(dir, name);
      return session.List();
    }
    if (cmd == "watch") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      Session session(dir, name);
      return session.Watch();
    }

    PrintUsage();
    return kExitUsage;
  } catch (const tw::Error& err) {
    std::cerr << tw::ErrorDomainName(err.domain) << " error: " << err.what() << std::endl;
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "Internal error: " << err.what() << std::endl;
    return kExitSoftware;
  }
}
