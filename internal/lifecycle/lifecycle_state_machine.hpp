#pragma once

#include <memory>
#include <string>

#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace taskorch::lifecycle {

/*
  LifecycleStateMachine

  Task workflow after the claim:

    RUNNING -> REVIEW -> APPROVED -> COMPLETED
                      -> REJECTED -> QUEUED (retry_count + 1) | ESCALATED
                      -> ESCALATED (inconclusive)
    RUNNING -> QUEUED (executor failure, retry_count + 1) | ESCALATED
    any non-terminal -> FAILED

  Every hop is checked against model::CanTransition and leaves a
  STATE_<NAME> event. ESCALATED is never left automatically.
*/
class LifecycleStateMachine {
 public:
  LifecycleStateMachine(std::shared_ptr<db::Repository> repository, config::LifecycleOptions options, util::ClockFn clock = util::Now);

  // Throws util::StaleWorker when worker_id does not own the RUNNING task.
  db::model::TaskRecord SubmitForReview(const std::string& task_id, const std::string& worker_id, const std::string& result);

  // PENDING leaves the task untouched.
  db::model::TaskRecord ApplyConsensus(const std::string& task_id, taskorch::v1::ConsensusResult result, const std::string& feedback);

  db::model::TaskRecord ReportExecutorFailure(const std::string& task_id, const std::string& worker_id, const std::string& error);

  db::model::TaskRecord Fail(const std::string& task_id, const std::string& error);
  db::model::TaskRecord Cancel(const std::string& task_id, const std::string& reason);
  db::model::TaskRecord Escalate(const std::string& task_id, const std::string& reason);

 private:
  // Validates and applies one hop in memory, writing its event.
  void Step(db::Transaction& tx, db::model::TaskRecord& task, taskorch::v1::TaskState to, const std::string& actor,
            const std::string& detail, uint64_t now_ms);

  // Re-queue while retries remain, otherwise escalate.
  void RetryOrEscalate(db::Transaction& tx, db::model::TaskRecord& task, const std::string& actor, uint64_t now_ms);

  db::model::TaskRecord LoadOwned(db::Transaction& tx, const std::string& task_id, const std::string& worker_id);
  db::model::TaskRecord Load(db::Transaction& tx, const std::string& task_id);
  void                  Store(db::Transaction& tx, const db::model::TaskRecord& task);

  std::shared_ptr<db::Repository> repository_;
  config::LifecycleOptions        options_;
  util::ClockFn                   clock_;
};

} // namespace taskorch::lifecycle
