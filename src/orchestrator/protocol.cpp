#include "tw/orchestrator/protocol.h"

namespace tw::core {

Json::Value JsonCodec<orchestrator::Goodbye>::Encode(const orchestrator::Goodbye& goodbye) {
  Json::Value out(Json::objectValue);
  out["Message"] = goodbye.message;
  return out;
}

orchestrator::Goodbye JsonCodec<orchestrator::Goodbye>::Decode(const Json::Value& value) {
  return orchestrator::Goodbye{StringMember(value, "Message")};
}

Json::Value JsonCodec<orchestrator::EnqueueRequest>::Encode(const orchestrator::EnqueueRequest& request) {
  Json::Value out(Json::objectValue);
  out["ID"] = request.id;
  out["Task"] = request.task;
  if (!request.error.empty()) {
    out["Error"] = request.error;
  }
  return out;
}

orchestrator::EnqueueRequest JsonCodec<orchestrator::EnqueueRequest>::Decode(const Json::Value& value) {
  orchestrator::EnqueueRequest request;
  request.id = StringMember(value, "ID");
  request.task = StringMember(value, "Task");
  request.error = StringMember(value, "Error");
  return request;
}

// Log records use lower-case keys.
Json::Value JsonCodec<orchestrator::TaskQueued>::Encode(const orchestrator::TaskQueued& queued) {
  Json::Value out(Json::objectValue);
  out["id"] = queued.id;
  out["task"] = queued.task;
  out["opname"] = queued.opname;
  out["qlen"] = static_cast<Json::Int64>(queued.qlen);
  return out;
}

orchestrator::TaskQueued JsonCodec<orchestrator::TaskQueued>::Decode(const Json::Value& value) {
  orchestrator::TaskQueued queued;
  queued.id = StringMember(value, "id");
  queued.task = StringMember(value, "task");
  queued.opname = StringMember(value, "opname");
  const Json::Value& qlen = value["qlen"];
  if (!qlen.isNull()) {
    queued.qlen = JsonCodec<std::int64_t>::Decode(qlen);
  }
  return queued;
}

} // namespace tw::core
