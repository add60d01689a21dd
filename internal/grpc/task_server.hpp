#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/task_service.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::grpc {

class TaskServer final : public taskorch::v1::TaskService::Service {
public:
  explicit TaskServer(std::shared_ptr<taskorch::service::TaskService> svc);

  ::grpc::Status EnqueueTask(::grpc::ServerContext*,
                        const taskorch::v1::EnqueueTaskRequest*,
                        taskorch::v1::EnqueueTaskResponse*) override;

  ::grpc::Status GetTask(::grpc::ServerContext*,
                        const taskorch::v1::GetTaskRequest*,
                        taskorch::v1::GetTaskResponse*) override;

  ::grpc::Status ListTasks(::grpc::ServerContext*,
                        const taskorch::v1::ListTasksRequest*,
                        taskorch::v1::ListTasksResponse*) override;

  ::grpc::Status CancelTask(::grpc::ServerContext*,
                        const taskorch::v1::CancelTaskRequest*,
                        taskorch::v1::CancelTaskResponse*) override;

  ::grpc::Status Dispatch(::grpc::ServerContext*,
                        const taskorch::v1::AgentMessage*,
                        taskorch::v1::AgentMessage*) override;

private:
  std::shared_ptr<taskorch::service::TaskService> service_;
};

}
