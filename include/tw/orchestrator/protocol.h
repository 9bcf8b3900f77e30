#pragma once

#include <cstdint>
#include <string>

#include <json/json.h>

#include "tw/core/json_codec.h"

namespace tw::orchestrator {

  // Sent to every operator before the server disconnects them.
  struct Goodbye {
    std::string message;
  };

  // Operator request to queue a task; echoed back with |error| set when
  // rejected.
  struct EnqueueRequest {
    std::string id;
    std::string task;
    std::string error;
  };

  // Fields of the "Task queued" log event an operator may subscribe to.
  struct TaskQueued {
    std::string id;
    std::string task;
    std::string opname;
    std::int64_t qlen{0};
  };

} // namespace tw::orchestrator

namespace tw::core {

  template <>
  struct JsonCodec<orchestrator::Goodbye> {
    static Json::Value Encode(const orchestrator::Goodbye& goodbye);
    static orchestrator::Goodbye Decode(const Json::Value& value);
  };

  template <>
  struct JsonCodec<orchestrator::EnqueueRequest> {
    static Json::Value Encode(const orchestrator::EnqueueRequest& request);
    static orchestrator::EnqueueRequest Decode(const Json::Value& value);
  };

  template <>
  struct JsonCodec<orchestrator::TaskQueued> {
    static Json::Value Encode(const orchestrator::TaskQueued& queued);
    static orchestrator::TaskQueued Decode(const Json::Value& value);
  };

} // namespace tw::core
