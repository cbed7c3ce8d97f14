#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace settle::util {

/*
  Time utilities. Single place to control clock source.

  Event and batch timestamps are stored with millisecond precision.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);
// Storage resolution; rounds toward the earlier millisecond.
TimePoint    FloorToMillis(TimePoint tp);

// ISO-8601 UTC rendering, e.g. 2024-05-01T00:00:00.000Z
std::string FormatUtc(TimePoint tp);

} // namespace settle::util
