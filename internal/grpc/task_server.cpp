#include "task_server.hpp"

#include "grpc_error.hpp"

namespace taskorch::grpc {

TaskServer::TaskServer(std::shared_ptr<taskorch::service::TaskService> svc) : service_(std::move(svc)) {
}

::grpc::Status TaskServer::EnqueueTask(::grpc::ServerContext*, const taskorch::v1::EnqueueTaskRequest* req, taskorch::v1::EnqueueTaskResponse* resp) {
  try {
    *resp = service_->EnqueueTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::GetTask(::grpc::ServerContext*, const taskorch::v1::GetTaskRequest* req, taskorch::v1::GetTaskResponse* resp) {
  try {
    *resp = service_->GetTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::ListTasks(::grpc::ServerContext*, const taskorch::v1::ListTasksRequest* req, taskorch::v1::ListTasksResponse* resp) {
  try {
    *resp = service_->ListTasks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::CancelTask(::grpc::ServerContext*, const taskorch::v1::CancelTaskRequest* req, taskorch::v1::CancelTaskResponse* resp) {
  try {
    *resp = service_->CancelTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::Dispatch(::grpc::ServerContext*, const taskorch::v1::AgentMessage* req, taskorch::v1::AgentMessage* resp) {
  try {
    *resp = service_->Dispatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace taskorch::grpc
