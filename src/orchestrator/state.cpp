#include "tw/orchestrator/state.h"

#include <algorithm>
#include <utility>

#include "tw/common.h"
#include "tw/orchestrator/defs.h"

namespace tw::orchestrator {

size_t State::Enqueue(const std::string& id, std::string task) {
  auto& queue = task_q[id];
  queue.push_back(std::move(task));
  return queue.size();
}

std::optional<std::string> State::NextTask(const std::string& id) {
  auto it = task_q.find(id);
  if (it == task_q.end()) {
    return std::nullopt;
  }
  if (it->second.empty()) {
    task_q.erase(it);
    return std::nullopt;
  }
  std::string task = std::move(it->second.front());
  it->second.erase(it->second.begin());
  if (it->second.empty()) {
    task_q.erase(it);
  }
  return task;
}

size_t State::QueueLength(const std::string& id) const {
  auto it = task_q.find(id);
  return it == task_q.end() ? 0 : it->second.size();
}

bool State::Saw(const std::string& id, std::string from, std::chrono::system_clock::time_point when) {
  auto it = std::find_if(last_seen.begin(), last_seen.end(),
                         [&](const SeenImplant& seen) { return seen.id == id; });
  const bool is_new = it == last_seen.end();
  if (!is_new) {
    last_seen.erase(it);
  }
  last_seen.insert(last_seen.begin(), SeenImplant{id, std::move(from), when});
  if (last_seen.size() > kNSeen) {
    last_seen.resize(kNSeen);
  }
  return is_new;
}

std::unique_ptr<StateManager> OpenState(const std::filesystem::path& dir,
                                        std::chrono::milliseconds write_delay,
                                        std::function<void(const Error&)> on_error) {
  storage::PersistConfig config;
  config.file = dir / std::string(kStateFile);
  config.file_permissions = kFilePerms;
  config.write_delay = write_delay;
  config.on_error = std::move(on_error);
  return StateManager::Open(std::move(config));
}

} // namespace tw::orchestrator

namespace tw::core {

Json::Value JsonCodec<orchestrator::SeenImplant>::Encode(const orchestrator::SeenImplant& seen) {
  Json::Value out(Json::objectValue);
  out["ID"] = seen.id;
  out["From"] = seen.from;
  out["When"] = FormatTimestamp(seen.when);
  return out;
}

orchestrator::SeenImplant JsonCodec<orchestrator::SeenImplant>::Decode(const Json::Value& value) {
  orchestrator::SeenImplant seen;
  seen.id = StringMember(value, "ID");
  seen.from = StringMember(value, "From");
  const std::string when = StringMember(value, "When");
  if (!when.empty()) {
    auto parsed = ParseTimestamp(when);
    if (!parsed) {
      ThrowPayloadMismatch("RFC 3339 timestamp", value["When"]);
    }
    seen.when = *parsed;
  }
  return seen;
}

Json::Value JsonCodec<orchestrator::State>::Encode(const orchestrator::State& state) {
  Json::Value out(Json::objectValue);
  out["TaskQ"] = JsonCodec<std::map<std::string, std::vector<std::string>>>::Encode(state.task_q);
  out["LastSeen"] = JsonCodec<std::vector<orchestrator::SeenImplant>>::Encode(state.last_seen);
  return out;
}

orchestrator::State JsonCodec<orchestrator::State>::Decode(const Json::Value& value) {
  if (!value.isObject()) {
    ThrowPayloadMismatch("object", value);
  }
  orchestrator::State state;
  state.task_q = JsonCodec<std::map<std::string, std::vector<std::string>>>::Decode(value["TaskQ"]);
  state.last_seen = JsonCodec<std::vector<orchestrator::SeenImplant>>::Decode(value["LastSeen"]);
  if (state.last_seen.size() > orchestrator::kNSeen) {
    state.last_seen.resize(orchestrator::kNSeen);
  }
  return state;
}

} // namespace tw::core
