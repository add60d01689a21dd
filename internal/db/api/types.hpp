#pragma once

#include <optional>
#include <string>
#include <vector>

namespace taskorch::db {

/*
  Claim candidate filter.

  A task with no shard (or no assigned model) matches any filter value.
  An empty type list matches every task type.
*/
struct ClaimFilter {
  std::optional<std::string> shard;
  std::optional<std::string> model;
  std::vector<std::string>   types;
};

} // namespace taskorch::db
