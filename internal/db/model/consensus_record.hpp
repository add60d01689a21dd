#pragma once

#include <cstdint>
#include <string>

#include "taskorch/v1/types.pb.h"

namespace taskorch::db::model {

struct ConsensusSessionRecord {
  std::string id;
  std::string task_id;
  std::string implementer;

  taskorch::v1::ConsensusResult final_result = taskorch::v1::CONSENSUS_RESULT_PENDING;

  // Approvals (or rejections) needed to decide.
  uint32_t required   = 0;
  uint32_t approvals  = 0;
  uint32_t rejections = 0;

  uint64_t created_at_ms   = 0;
  uint64_t completed_at_ms = 0;
};

struct VoteRecord {
  std::string        session_id;
  std::string        voter;
  taskorch::v1::Vote vote = taskorch::v1::VOTE_UNSPECIFIED;
  std::string        reason;
  uint64_t           duration_ms    = 0;
  uint64_t           recorded_at_ms = 0;
};

} // namespace taskorch::db::model
