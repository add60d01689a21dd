#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "taskorch/v1.hpp"

using namespace taskorch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  taskorchctl <addr> enqueue <type> <name> [priority=CRITICAL|HIGH|MEDIUM|LOW] [payload]\n"
            << "  taskorchctl <addr> get <task_id>\n"
            << "  taskorchctl <addr> list [state]\n"
            << "  taskorchctl <addr> cancel <task_id> [reason]\n"
            << "  taskorchctl <addr> approve <task_id> [feedback]\n"
            << "  taskorchctl <addr> reject <task_id> <feedback>\n"
            << "  taskorchctl <addr> stats\n"
            << "  taskorchctl <addr> workers\n"
            << "  taskorchctl <addr> pause [reason]\n"
            << "  taskorchctl <addr> resume\n"
            << "  taskorchctl <addr> breakers\n"
            << "  taskorchctl <addr> reset-breaker <capability>\n"
            << "  taskorchctl <addr> budget\n"
            << "  taskorchctl <addr> reset-kill-switch <operator>\n";
}

static std::optional<Priority> ParsePriority(const std::string& value) {
  Priority priority;
  if (Priority_Parse("PRIORITY_" + value, &priority)) {
    return priority;
  }
  return std::nullopt;
}

static std::optional<TaskState> ParseState(const std::string& value) {
  TaskState state;
  if (TaskState_Parse("TASK_STATE_" + value, &state)) {
    return state;
  }
  return std::nullopt;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& message) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  std::string json;
  const auto  printed = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!printed.ok()) {
    std::cerr << printed.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto task_stub  = TaskService::NewStub(channel);
  auto admin_stub = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 5) return 1;

    EnqueueTaskRequest req;
    req.set_type(argv[3]);
    req.set_name(argv[4]);
    if (argc >= 6) {
      auto parsed = ParsePriority(argv[5]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported priority: " << argv[5] << "\n";
        return 1;
      }
      req.set_priority(parsed.value());
    }
    if (argc >= 7) {
      req.set_payload(argv[6]);
    }

    EnqueueTaskResponse resp;
    return Print(task_stub->EnqueueTask(&ctx, req, &resp), resp);
  }

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetTaskRequest req;
    req.set_id(argv[3]);
    GetTaskResponse resp;
    return Print(task_stub->GetTask(&ctx, req, &resp), resp);
  }

  if (cmd == "list") {
    ListTasksRequest req;
    if (argc >= 4) {
      auto parsed = ParseState(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported state: " << argv[3] << "\n";
        return 1;
      }
      req.set_state(parsed.value());
    }
    ListTasksResponse resp;
    return Print(task_stub->ListTasks(&ctx, req, &resp), resp);
  }

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelTaskRequest req;
    req.set_id(argv[3]);
    if (argc >= 5) req.set_reason(argv[4]);
    CancelTaskResponse resp;
    return Print(task_stub->CancelTask(&ctx, req, &resp), resp);
  }

  if (cmd == "approve" || cmd == "reject") {
    if (argc < (cmd == "reject" ? 5 : 4)) return 1;

    AgentMessage msg;
    msg.set_type(cmd == "approve" ? MESSAGE_TYPE_TASK_APPROVE : MESSAGE_TYPE_TASK_REJECT);
    msg.set_source("taskorchctl");
    msg.set_task_id(argv[3]);
    if (argc >= 5) msg.set_payload(argv[4]);
    AgentMessage ack;
    return Print(task_stub->Dispatch(&ctx, msg, &ack), ack);
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    return Print(admin_stub->Stats(&ctx, StatsRequest{}, &resp), resp);
  }

  if (cmd == "workers") {
    ListWorkersResponse resp;
    return Print(admin_stub->ListWorkers(&ctx, ListWorkersRequest{}, &resp), resp);
  }

  if (cmd == "pause") {
    PauseRequest req;
    if (argc >= 4) req.set_reason(argv[3]);
    PauseResponse resp;
    return Print(admin_stub->Pause(&ctx, req, &resp), resp);
  }

  if (cmd == "resume") {
    PauseResponse resp;
    return Print(admin_stub->Resume(&ctx, ResumeRequest{}, &resp), resp);
  }

  if (cmd == "breakers") {
    GetBreakersResponse resp;
    return Print(admin_stub->GetBreakers(&ctx, GetBreakersRequest{}, &resp), resp);
  }

  if (cmd == "reset-breaker") {
    if (argc < 4) return 1;

    ResetBreakerRequest req;
    req.set_capability(argv[3]);
    ResetBreakerResponse resp;
    return Print(admin_stub->ResetBreaker(&ctx, req, &resp), resp);
  }

  if (cmd == "budget") {
    BudgetStatus resp;
    return Print(admin_stub->GetBudgetStatus(&ctx, GetBudgetStatusRequest{}, &resp), resp);
  }

  if (cmd == "reset-kill-switch") {
    if (argc < 4) return 1;

    ResetKillSwitchRequest req;
    req.set_operator_id(argv[3]);
    BudgetStatus resp;
    return Print(admin_stub->ResetKillSwitch(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
