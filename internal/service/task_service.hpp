#pragma once

#include "message_router.hpp"
#include "service_context.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::service {

class TaskService {
 public:
  explicit TaskService(ServiceContext ctx);

  taskorch::v1::EnqueueTaskResponse EnqueueTask(const taskorch::v1::EnqueueTaskRequest& req);
  taskorch::v1::GetTaskResponse     GetTask(const taskorch::v1::GetTaskRequest& req);
  taskorch::v1::ListTasksResponse   ListTasks(const taskorch::v1::ListTasksRequest& req);
  taskorch::v1::CancelTaskResponse  CancelTask(const taskorch::v1::CancelTaskRequest& req);
  taskorch::v1::AgentMessage        Dispatch(const taskorch::v1::AgentMessage& message);

 private:
  ServiceContext ctx_;
  MessageRouter  router_;
};

} // namespace taskorch::service
