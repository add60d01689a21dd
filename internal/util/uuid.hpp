#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace taskorch::util {

/*
  UUID helpers

  Task ids are "T-" + RFC4122 v4 text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewTaskId();

// n random lowercase hex characters
std::string RandomHex(size_t n);

} // namespace taskorch::util
