#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::grpc {

class AdminServer final : public taskorch::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<taskorch::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                        const taskorch::v1::StatsRequest*,
                        taskorch::v1::StatsResponse*) override;

  ::grpc::Status ListWorkers(::grpc::ServerContext*,
                        const taskorch::v1::ListWorkersRequest*,
                        taskorch::v1::ListWorkersResponse*) override;

  ::grpc::Status Pause(::grpc::ServerContext*,
                        const taskorch::v1::PauseRequest*,
                        taskorch::v1::PauseResponse*) override;

  ::grpc::Status Resume(::grpc::ServerContext*,
                        const taskorch::v1::ResumeRequest*,
                        taskorch::v1::PauseResponse*) override;

  ::grpc::Status GetBreakers(::grpc::ServerContext*,
                        const taskorch::v1::GetBreakersRequest*,
                        taskorch::v1::GetBreakersResponse*) override;

  ::grpc::Status ResetBreaker(::grpc::ServerContext*,
                        const taskorch::v1::ResetBreakerRequest*,
                        taskorch::v1::ResetBreakerResponse*) override;

  ::grpc::Status GetBudgetStatus(::grpc::ServerContext*,
                        const taskorch::v1::GetBudgetStatusRequest*,
                        taskorch::v1::BudgetStatus*) override;

  ::grpc::Status ResetKillSwitch(::grpc::ServerContext*,
                        const taskorch::v1::ResetKillSwitchRequest*,
                        taskorch::v1::BudgetStatus*) override;

  ::grpc::Status RecordSpend(::grpc::ServerContext*,
                        const taskorch::v1::RecordSpendRequest*,
                        taskorch::v1::RecordSpendResponse*) override;

private:
  std::shared_ptr<taskorch::service::AdminService> service_;
};

}
