#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace taskorch::grpc {

AdminServer::AdminServer(std::shared_ptr<taskorch::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const taskorch::v1::StatsRequest* req, taskorch::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListWorkers(::grpc::ServerContext*, const taskorch::v1::ListWorkersRequest* req, taskorch::v1::ListWorkersResponse* resp) {
  try {
    *resp = service_->ListWorkers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Pause(::grpc::ServerContext*, const taskorch::v1::PauseRequest* req, taskorch::v1::PauseResponse* resp) {
  try {
    *resp = service_->Pause(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Resume(::grpc::ServerContext*, const taskorch::v1::ResumeRequest* req, taskorch::v1::PauseResponse* resp) {
  try {
    *resp = service_->Resume(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetBreakers(::grpc::ServerContext*, const taskorch::v1::GetBreakersRequest* req, taskorch::v1::GetBreakersResponse* resp) {
  try {
    *resp = service_->GetBreakers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ResetBreaker(::grpc::ServerContext*, const taskorch::v1::ResetBreakerRequest* req, taskorch::v1::ResetBreakerResponse* resp) {
  try {
    *resp = service_->ResetBreaker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetBudgetStatus(::grpc::ServerContext*, const taskorch::v1::GetBudgetStatusRequest* req, taskorch::v1::BudgetStatus* resp) {
  try {
    *resp = service_->GetBudgetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ResetKillSwitch(::grpc::ServerContext*, const taskorch::v1::ResetKillSwitchRequest* req, taskorch::v1::BudgetStatus* resp) {
  try {
    *resp = service_->ResetKillSwitch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RecordSpend(::grpc::ServerContext*, const taskorch::v1::RecordSpendRequest* req, taskorch::v1::RecordSpendResponse* resp) {
  try {
    *resp = service_->RecordSpend(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace taskorch::grpc
