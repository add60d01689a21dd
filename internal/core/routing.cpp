#include "routing.hpp"

#include <array>
#include <cctype>
#include <map>
#include <utility>

namespace taskorch::core {

namespace {

constexpr std::array<uint32_t, 256> BuildCrcTable() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1U) ? 0xEDB88320U ^ (c >> 1) : c >> 1;
    }
    table[i] = c;
  }
  return table;
}

constexpr auto kCrcTable = BuildCrcTable();

std::string Upper(std::string_view value) {
  std::string out(value);
  for (auto& ch : out) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return out;
}

} // namespace

RoutingTable::RoutingTable(config::RoutingOptions options) : options_(std::move(options)) {
  std::map<std::string, config::Route> normalized;
  for (auto& [type, route] : options_.table) {
    normalized[Upper(type)] = std::move(route);
  }
  options_.table = std::move(normalized);
}

const config::Route& RoutingTable::Resolve(std::string_view task_type) const {
  const auto it = options_.table.find(Upper(task_type));
  return it == options_.table.end() ? options_.fallback : it->second;
}

std::vector<std::string> RoutingTable::TypesForLane(std::string_view lane) const {
  std::vector<std::string> types;
  for (const auto& [type, route] : options_.table) {
    if (route.lane == lane) {
      types.push_back(type);
    }
  }
  return types;
}

uint32_t Crc32(std::string_view key) {
  uint32_t crc = 0xFFFFFFFFU;
  for (unsigned char ch : key) {
    crc = kCrcTable[(crc ^ ch) & 0xFFU] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFU;
}

std::string ShardFor(std::string_view task_key, uint32_t shard_count) {
  const uint32_t count = shard_count == 0 ? 1 : shard_count;
  return "shard-" + std::to_string(Crc32(task_key) % count);
}

} // namespace taskorch::core
