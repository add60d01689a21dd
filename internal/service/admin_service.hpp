#pragma once

#include "service_context.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  taskorch::v1::StatsResponse         Stats(const taskorch::v1::StatsRequest& req);
  taskorch::v1::ListWorkersResponse   ListWorkers(const taskorch::v1::ListWorkersRequest& req);
  taskorch::v1::PauseResponse         Pause(const taskorch::v1::PauseRequest& req);
  taskorch::v1::PauseResponse         Resume(const taskorch::v1::ResumeRequest& req);
  taskorch::v1::GetBreakersResponse   GetBreakers(const taskorch::v1::GetBreakersRequest& req);
  taskorch::v1::ResetBreakerResponse  ResetBreaker(const taskorch::v1::ResetBreakerRequest& req);
  taskorch::v1::BudgetStatus          GetBudgetStatus(const taskorch::v1::GetBudgetStatusRequest& req);
  taskorch::v1::BudgetStatus          ResetKillSwitch(const taskorch::v1::ResetKillSwitchRequest& req);
  taskorch::v1::RecordSpendResponse   RecordSpend(const taskorch::v1::RecordSpendRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace taskorch::service
