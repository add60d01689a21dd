#pragma once

#include "service_context.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::service {

/*
  Applies AgentMessages from external supervisors.

    TASK_ASSIGN            claim task_id for target
    TASK_APPROVE / REJECT  consensus decision on a REVIEW task
    HEARTBEAT              payload is a HeartbeatPayload in JSON
    CONTROL_PAUSE / RESUME pool pause flag

  Every handled message is answered with an ACK carrying the same
  trace_id. Other types throw util::InvalidArgument.
*/
class MessageRouter {
 public:
  explicit MessageRouter(ServiceContext ctx);

  taskorch::v1::AgentMessage Dispatch(const taskorch::v1::AgentMessage& message);

 private:
  void HandleHeartbeat(const taskorch::v1::AgentMessage& message);

  ServiceContext ctx_;
};

} // namespace taskorch::service
