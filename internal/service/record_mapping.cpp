#include "record_mapping.hpp"

#include "internal/util/time.hpp"

namespace taskorch::service {

using namespace taskorch::v1;
using util::MillisToProto;

Task ToProto(const db::model::TaskRecord& record) {
  Task task;
  task.set_id(record.id);
  task.set_name(record.name);
  task.set_type(record.type);
  task.set_priority(record.priority);
  task.set_state(record.state);
  task.set_lane(record.lane);
  task.set_shard(record.shard);
  task.set_assigned_model(record.assigned_model);
  task.set_worker_id(record.worker_id);
  task.set_payload(record.payload);
  task.set_result(record.result);
  task.set_error(record.error);
  task.set_feedback(record.feedback);
  task.set_trace_id(record.trace_id);
  task.set_retry_count(record.retry_count);
  task.set_max_retries(record.max_retries);
  *task.mutable_created_at()   = MillisToProto(record.created_at_ms);
  *task.mutable_started_at()   = MillisToProto(record.started_at_ms);
  *task.mutable_heartbeat_at() = MillisToProto(record.heartbeat_at_ms);
  *task.mutable_completed_at() = MillisToProto(record.completed_at_ms);
  return task;
}

TaskEvent ToProto(const db::model::EventRecord& record) {
  TaskEvent event;
  event.set_id(record.id);
  event.set_task_id(record.task_id);
  event.set_event_type(record.event_type);
  event.set_actor(record.actor);
  event.set_payload(record.payload);
  event.set_trace_id(record.trace_id);
  *event.mutable_timestamp() = MillisToProto(record.timestamp_ms);
  return event;
}

Worker ToProto(const db::model::WorkerRecord& record, uint32_t running_tasks) {
  Worker worker;
  worker.set_worker_id(record.worker_id);
  worker.set_pid(record.pid);
  worker.set_status(record.status);
  worker.set_shard(record.shard);
  worker.set_specialization(record.specialization);
  worker.set_model(record.model);
  worker.set_tasks_completed(record.tasks_completed);
  worker.set_tasks_failed(record.tasks_failed);
  worker.set_crash_count(record.crash_count);
  worker.set_running_tasks(running_tasks);
  *worker.mutable_started_at()     = MillisToProto(record.started_at_ms);
  *worker.mutable_last_heartbeat() = MillisToProto(record.last_heartbeat_ms);
  return worker;
}

VoteRecord ToProto(const db::model::VoteRecord& record) {
  VoteRecord vote;
  vote.set_session_id(record.session_id);
  vote.set_voter(record.voter);
  vote.set_vote(record.vote);
  vote.set_reason(record.reason);
  vote.set_duration_ms(record.duration_ms);
  *vote.mutable_recorded_at() = MillisToProto(record.recorded_at_ms);
  return vote;
}

ConsensusSession ToProto(const consensus::SessionView& view) {
  ConsensusSession session;
  session.set_id(view.session.id);
  session.set_task_id(view.session.task_id);
  session.set_implementer(view.session.implementer);
  session.set_final_result(view.session.final_result);
  session.set_required(view.session.required);
  session.set_approvals(view.session.approvals);
  session.set_rejections(view.session.rejections);
  for (const auto& vote : view.votes) {
    *session.add_votes() = ToProto(vote);
  }
  *session.mutable_created_at()   = MillisToProto(view.session.created_at_ms);
  *session.mutable_completed_at() = MillisToProto(view.session.completed_at_ms);
  return session;
}

Breaker ToProto(const db::model::BreakerRecord& record) {
  Breaker breaker;
  breaker.set_capability(record.capability);
  breaker.set_state(record.state);
  breaker.set_failure_count(record.failure_count);
  breaker.set_half_open_calls(record.half_open_calls);
  *breaker.mutable_opened_at()    = MillisToProto(record.opened_at_ms);
  *breaker.mutable_last_failure() = MillisToProto(record.last_failure_ms);
  *breaker.mutable_last_success() = MillisToProto(record.last_success_ms);
  return breaker;
}

KillSwitch ToProto(const db::model::KillSwitchRecord& record) {
  KillSwitch kill;
  kill.set_active(record.active);
  kill.set_reason(record.reason);
  kill.set_reset_by(record.reset_by);
  *kill.mutable_triggered_at() = MillisToProto(record.triggered_at_ms);
  *kill.mutable_reset_at()     = MillisToProto(record.reset_at_ms);
  return kill;
}

BudgetStatus ToProto(const budget::BudgetStatus& status) {
  BudgetStatus out;
  out.set_spend_rate_per_minute(status.spend_rate_per_minute);
  out.set_daily_spend(status.daily_spend);
  out.set_rate_limit_per_minute(status.rate_limit_per_minute);
  out.set_daily_limit(status.daily_limit);
  *out.mutable_kill_switch() = ToProto(status.kill_switch);
  return out;
}

PauseResponse ToProto(const db::model::PauseRecord& record) {
  PauseResponse out;
  out.set_paused(record.paused);
  out.set_reason(record.reason);
  *out.mutable_requested_at() = MillisToProto(record.requested_at_ms);
  return out;
}

} // namespace taskorch::service
