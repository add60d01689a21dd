#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/options.hpp"

namespace taskorch::core {

/*
  Task type -> {capability, lane}.

  Built once from config; lookups never fall through to ad hoc
  string matching. Unknown types get the fallback route.
*/
class RoutingTable {
 public:
  explicit RoutingTable(config::RoutingOptions options);

  const config::Route& Resolve(std::string_view task_type) const;

  // Task types routed to the given lane, sorted.
  std::vector<std::string> TypesForLane(std::string_view lane) const;

 private:
  config::RoutingOptions options_;
};

// CRC-32 (IEEE) of key.
uint32_t Crc32(std::string_view key);

// "shard-N" with N = crc32(key) mod shard_count. shard_count 0 is treated as 1.
std::string ShardFor(std::string_view task_key, uint32_t shard_count);

} // namespace taskorch::core
