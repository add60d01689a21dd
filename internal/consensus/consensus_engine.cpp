#include "consensus_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>

#include "internal/core/store_ops.hpp"
#include "internal/model/enums.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace taskorch::consensus {

using namespace taskorch::v1;
using db::model::ConsensusSessionRecord;
using db::model::VoteRecord;

namespace {

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) { return Contains(haystack, needle); });
}

} // namespace

ConsensusEngine::ConsensusEngine(std::shared_ptr<db::Repository> repository, config::ConsensusOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), options_(std::move(options)), clock_(std::move(clock)) {
}

std::vector<std::string> ConsensusEngine::VotersFor(const std::string& implementer) const {
  std::vector<std::string> voters;
  for (const auto& capability : options_.capabilities) {
    if (capability != implementer) {
      voters.push_back(capability);
    }
  }
  return voters;
}

uint32_t ConsensusEngine::RequiredFor(const std::string& task_type, const std::string& implementer) const {
  const auto expected = static_cast<uint32_t>(VotersFor(implementer).size());
  const bool unanimous =
      std::find(options_.unanimous_task_types.begin(), options_.unanimous_task_types.end(), task_type) != options_.unanimous_task_types.end();
  if (unanimous) {
    return expected;
  }
  return std::min(options_.min_approvals, expected);
}

ConsensusResult ConsensusEngine::Decide(uint32_t approvals, uint32_t rejections, uint32_t responded, uint32_t expected, uint32_t required) {
  if (required > 0 && approvals >= required) {
    return CONSENSUS_RESULT_PASS;
  }
  if (required > 0 && rejections >= required) {
    return CONSENSUS_RESULT_FAIL;
  }
  if (responded >= expected) {
    return CONSENSUS_RESULT_INCONCLUSIVE;
  }
  return CONSENSUS_RESULT_PENDING;
}

Vote ConsensusEngine::ParseVote(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

  if (ContainsAny(lower, {"approve", "lgtm", "pass"})) {
    return VOTE_APPROVE;
  }
  if (ContainsAny(lower, {"reject", "fail", "block"})) {
    return VOTE_REJECT;
  }
  if (ContainsAny(lower, {"timeout", "timed out"})) {
    return VOTE_TIMEOUT;
  }
  if (Contains(lower, "error")) {
    return VOTE_ERROR;
  }
  return VOTE_ABSTAIN;
}

std::string ConsensusEngine::CreateSession(const std::string& task_id, const std::string& implementer) {
  auto session = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto task = repository_->GetTask(tx, task_id);
    if (!task) {
      throw util::NotFound("task not found: " + task_id);
    }

    const auto now = clock_();
    ConsensusSessionRecord record;
    record.id = "CS-" + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count()) + "-" + task_id + "-" +
                util::RandomHex(8);
    record.task_id       = task_id;
    record.implementer   = implementer;
    record.final_result  = CONSENSUS_RESULT_PENDING;
    record.required      = RequiredFor(task->type, implementer);
    record.created_at_ms = util::ToUnixMillis(now);
    core::ThrowIfDbError(repository_->InsertSession(tx, record), "create session for " + task_id);
    core::AppendEvent(*repository_, tx, task_id, "CONSENSUS_STARTED", implementer, record.id, task->trace_id, record.created_at_ms);
    return record;
  });

  TASKORCH_LOG_INFO("Consensus session opened", {observability::StringField("session_id", session.id),
                                                 observability::StringField("task_id", task_id),
                                                 observability::IntField("required", session.required)});
  return session.id;
}

SessionView ConsensusEngine::Load(db::Transaction& tx, const std::string& session_id) {
  auto session = repository_->GetSession(tx, session_id);
  if (!session) {
    throw util::NotFound("consensus session not found: " + session_id);
  }
  SessionView view;
  view.session = *session;
  view.votes   = repository_->ListVotes(tx, session_id);
  view.voters  = VotersFor(session->implementer);
  return view;
}

void ConsensusEngine::RecordVote(const std::string& session_id, const std::string& voter, Vote vote, const std::string& reason,
                                 uint64_t duration_ms) {
  if (vote == VOTE_UNSPECIFIED) {
    throw util::InvalidArgument("vote is required");
  }

  core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto view = Load(tx, session_id);
    if (voter == view.session.implementer) {
      throw util::InvalidArgument("implementer " + voter + " cannot vote on its own work");
    }
    if (std::find(view.voters.begin(), view.voters.end(), voter) == view.voters.end()) {
      throw util::InvalidArgument("unknown voter " + voter + " for session " + session_id);
    }
    if (view.session.final_result != CONSENSUS_RESULT_PENDING) {
      throw util::InvalidState("session " + session_id + " already decided " + std::string(model::ToString(view.session.final_result)));
    }

    VoteRecord record;
    record.session_id     = session_id;
    record.voter          = voter;
    record.vote           = vote;
    record.reason         = reason;
    record.duration_ms    = duration_ms;
    record.recorded_at_ms = util::ToUnixMillis(clock_());
    core::ThrowIfDbError(repository_->UpsertVote(tx, record), "record vote " + voter);
  });
}

ConsensusResult ConsensusEngine::Evaluate(const std::string& session_id) {
  bool decided_now = false;
  auto result      = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    decided_now = false;
    auto view   = Load(tx, session_id);
    if (view.session.final_result != CONSENSUS_RESULT_PENDING) {
      return view.session.final_result;
    }

    uint32_t approvals  = 0;
    uint32_t rejections = 0;
    for (const auto& vote : view.votes) {
      approvals += vote.vote == VOTE_APPROVE ? 1 : 0;
      rejections += vote.vote == VOTE_REJECT ? 1 : 0;
    }

    auto& session      = view.session;
    session.approvals  = approvals;
    session.rejections = rejections;
    const auto decided = Decide(approvals, rejections, static_cast<uint32_t>(view.votes.size()), static_cast<uint32_t>(view.voters.size()),
                                session.required);
    if (decided == CONSENSUS_RESULT_PENDING) {
      return decided;
    }

    const auto now_ms       = util::ToUnixMillis(clock_());
    session.final_result    = decided;
    session.completed_at_ms = now_ms;
    core::ThrowIfDbError(repository_->UpdateSession(tx, session), "decide session " + session_id);

    std::string trace_id;
    if (auto task = repository_->GetTask(tx, session.task_id)) {
      trace_id = task->trace_id;
    }
    core::AppendEvent(*repository_, tx, session.task_id, "CONSENSUS_" + std::string(model::ToString(decided)), "consensus", session_id, trace_id,
                      now_ms);
    decided_now = true;
    return decided;
  });

  if (decided_now) {
    observability::Metrics::Instance().RecordConsensus(model::ToString(result));
  }
  if (result == CONSENSUS_RESULT_INCONCLUSIVE) {
    TASKORCH_LOG_WARN("Consensus inconclusive", {observability::StringField("session_id", session_id)});
  }
  return result;
}

ConsensusResult ConsensusEngine::ExpireSession(const std::string& session_id) {
  core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto view = Load(tx, session_id);
    if (view.session.final_result != CONSENSUS_RESULT_PENDING) {
      return;
    }
    const auto now_ms = util::ToUnixMillis(clock_());
    for (const auto& voter : view.voters) {
      const bool voted = std::any_of(view.votes.begin(), view.votes.end(), [&](const VoteRecord& v) { return v.voter == voter; });
      if (voted) {
        continue;
      }
      VoteRecord record;
      record.session_id     = session_id;
      record.voter          = voter;
      record.vote           = VOTE_TIMEOUT;
      record.reason         = "no vote within " + std::to_string(options_.vote_timeout.count()) + "ms";
      record.recorded_at_ms = now_ms;
      core::ThrowIfDbError(repository_->UpsertVote(tx, record), "expire vote " + voter);
    }
  });
  return Evaluate(session_id);
}

SessionView ConsensusEngine::GetSession(const std::string& session_id) {
  auto tx   = repository_->Begin();
  auto view = Load(*tx, session_id);
  tx->Commit();
  return view;
}

std::vector<SessionView> ConsensusEngine::SessionsForTask(const std::string& task_id) {
  std::vector<SessionView> views;
  auto                     tx = repository_->Begin();
  for (const auto& session : repository_->ListSessionsForTask(*tx, task_id)) {
    views.push_back(Load(*tx, session.id));
  }
  tx->Commit();
  return views;
}

} // namespace taskorch::consensus
