#pragma once

#include "internal/budget/budget_governor.hpp"
#include "internal/consensus/consensus_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::service {

// Store rows to wire messages. Zero timestamps stay unset.

taskorch::v1::Task             ToProto(const db::model::TaskRecord& record);
taskorch::v1::TaskEvent        ToProto(const db::model::EventRecord& record);
taskorch::v1::Worker           ToProto(const db::model::WorkerRecord& record, uint32_t running_tasks);
taskorch::v1::VoteRecord       ToProto(const db::model::VoteRecord& record);
taskorch::v1::ConsensusSession ToProto(const consensus::SessionView& view);
taskorch::v1::Breaker          ToProto(const db::model::BreakerRecord& record);
taskorch::v1::KillSwitch       ToProto(const db::model::KillSwitchRecord& record);
taskorch::v1::BudgetStatus     ToProto(const budget::BudgetStatus& status);
taskorch::v1::PauseResponse    ToProto(const db::model::PauseRecord& record);

} // namespace taskorch::service
