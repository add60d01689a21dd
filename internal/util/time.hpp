#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace taskorch::util {

/*
  Time utilities: single place to control the clock source.

  Components take a ClockFn so tests can drive time explicitly.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Zero means "unset" and maps to an empty Timestamp.
google::protobuf::Timestamp MillisToProto(uint64_t ms);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

// Start of the UTC day containing tp.
TimePoint StartOfUtcDay(TimePoint tp);

} // namespace taskorch::util
