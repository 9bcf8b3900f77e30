#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "tw/core/json_codec.h"
#include "tw/error.h"
#include "tw/storage/json_persist.h"

namespace tw::orchestrator {

  struct SeenImplant {
    std::string id;
    std::string from;
    std::chrono::system_clock::time_point when{};

    bool operator==(const SeenImplant&) const = default;
  };

  // State persisted between runs. Neither container is ever serialised as
  // null. Callers hold the owning manager's lock.
  struct State {
    std::map<std::string, std::vector<std::string>> task_q;
    std::vector<SeenImplant> last_seen; // newest first, at most kNSeen

    // Appends |task| to |id|'s queue and returns the new queue length.
    size_t Enqueue(const std::string& id, std::string task);

    // Pops the oldest task for |id|, dropping the queue once it empties.
    std::optional<std::string> NextTask(const std::string& id);

    [[nodiscard]] size_t QueueLength(const std::string& id) const;

    // Records a sighting, moving |id| to the front. Returns true when |id| was
    // not in the list.
    bool Saw(const std::string& id, std::string from,
             std::chrono::system_clock::time_point when = std::chrono::system_clock::now());
  };

  using StateManager = storage::Manager<State>;
  using StateReadGuard = storage::SharedDocGuard<State>;
  using StateWriteGuard = storage::ExclusiveDocGuard<State>;

  // Opens <dir>/state.json.
  std::unique_ptr<StateManager> OpenState(const std::filesystem::path& dir,
                                          std::chrono::milliseconds write_delay,
                                          std::function<void(const Error&)> on_error);

} // namespace tw::orchestrator

namespace tw::core {

  template <>
  struct JsonCodec<orchestrator::SeenImplant> {
    static Json::Value Encode(const orchestrator::SeenImplant& seen);
    static orchestrator::SeenImplant Decode(const Json::Value& value);
  };

  template <>
  struct JsonCodec<orchestrator::State> {
    static Json::Value Encode(const orchestrator::State& state);
    static orchestrator::State Decode(const Json::Value& value);
  };

} // namespace tw::core
