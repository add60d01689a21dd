#include "message_router.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/core/task_store.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/lifecycle/lifecycle_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pool/worker_pool_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace taskorch::service {

using namespace taskorch::v1;

namespace {

void RequireTask(const AgentMessage& message) {
  if (message.task_id().empty()) {
    throw util::InvalidArgument(MessageType_Name(message.type()) + " requires task_id");
  }
}

} // namespace

MessageRouter::MessageRouter(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void MessageRouter::HandleHeartbeat(const AgentMessage& message) {
  if (message.source().empty()) {
    throw util::InvalidArgument("HEARTBEAT requires source");
  }

  HeartbeatPayload payload;
  if (!message.payload().empty()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(message.payload(), &payload, options);
    if (!status.ok()) {
      throw util::InvalidArgument("invalid heartbeat payload: " + std::string(status.message()));
    }
  }

  ctx_.monitor->RecordHeartbeat(message.source(), message.task_id(), payload.progress_percent(), payload.expected_timeout_seconds());
}

AgentMessage MessageRouter::Dispatch(const AgentMessage& message) {
  switch (message.type()) {
    case MESSAGE_TYPE_TASK_ASSIGN:
      RequireTask(message);
      if (message.target().empty()) {
        throw util::InvalidArgument("TASK_ASSIGN requires target worker");
      }
      ctx_.tasks->AssignTask(message.task_id(), message.target());
      break;
    case MESSAGE_TYPE_TASK_APPROVE:
      RequireTask(message);
      ctx_.lifecycle->ApplyConsensus(message.task_id(), CONSENSUS_RESULT_PASS, message.payload());
      break;
    case MESSAGE_TYPE_TASK_REJECT:
      RequireTask(message);
      ctx_.lifecycle->ApplyConsensus(message.task_id(), CONSENSUS_RESULT_FAIL, message.payload());
      break;
    case MESSAGE_TYPE_HEARTBEAT:
      HandleHeartbeat(message);
      break;
    case MESSAGE_TYPE_CONTROL_PAUSE:
      ctx_.pool->RequestPause(message.payload().empty() ? "paused by " + message.source() : message.payload());
      break;
    case MESSAGE_TYPE_CONTROL_RESUME:
      ctx_.pool->Resume();
      break;
    default:
      throw util::InvalidArgument("unsupported message type: " + MessageType_Name(message.type()));
  }

  TASKORCH_LOG_INFO("Message dispatched", {observability::StringField("type", MessageType_Name(message.type())),
                                           observability::StringField("source", message.source()),
                                           observability::StringField("trace_id", message.trace_id())});

  AgentMessage ack;
  ack.set_id(util::ToString(util::GenerateUUID()));
  ack.set_type(MESSAGE_TYPE_ACK);
  ack.set_source("taskorch");
  ack.set_target(message.source());
  ack.set_task_id(message.task_id());
  ack.set_payload(message.id());
  ack.set_trace_id(message.trace_id());
  *ack.mutable_timestamp() = util::ToProto(util::Now());
  return ack;
}

} // namespace taskorch::service
