#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace taskorch::consensus {

struct SessionView {
  db::model::ConsensusSessionRecord  session;
  std::vector<db::model::VoteRecord> votes;
  std::vector<std::string>           voters;
};

/*
  Multi-voter approval gate.

  Voters are the configured capabilities minus the implementer.
  With V voters and threshold M (V for unanimous task types):

    approvals  >= M            -> PASS
    rejections >= M            -> FAIL
    all V responded, neither   -> INCONCLUSIVE
    otherwise                  -> PENDING

  INCONCLUSIVE is final; it never degrades into PASS or FAIL.
*/
class ConsensusEngine {
 public:
  ConsensusEngine(std::shared_ptr<db::Repository> repository, config::ConsensusOptions options, util::ClockFn clock = util::Now);

  std::string CreateSession(const std::string& task_id, const std::string& implementer);

  // Throws util::InvalidArgument for the implementer or an unknown voter,
  // util::InvalidState once the session is decided.
  void RecordVote(const std::string& session_id, const std::string& voter, taskorch::v1::Vote vote, const std::string& reason,
                  uint64_t duration_ms = 0);

  // Persists the outcome once it is no longer PENDING.
  taskorch::v1::ConsensusResult Evaluate(const std::string& session_id);

  // TIMEOUT for every voter that has not answered, then Evaluate.
  taskorch::v1::ConsensusResult ExpireSession(const std::string& session_id);

  SessionView              GetSession(const std::string& session_id);
  std::vector<SessionView> SessionsForTask(const std::string& task_id);

  std::vector<std::string> VotersFor(const std::string& implementer) const;

  // Approvals (or rejections) needed for the task type.
  uint32_t RequiredFor(const std::string& task_type, const std::string& implementer) const;

  static taskorch::v1::ConsensusResult Decide(uint32_t approvals, uint32_t rejections, uint32_t responded, uint32_t expected,
                                              uint32_t required);

  // Maps a free-form reviewer reply onto a vote.
  static taskorch::v1::Vote ParseVote(std::string_view text);

 private:
  SessionView Load(db::Transaction& tx, const std::string& session_id);

  std::shared_ptr<db::Repository> repository_;
  config::ConsensusOptions        options_;
  util::ClockFn                   clock_;
};

} // namespace taskorch::consensus
