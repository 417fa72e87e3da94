#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace vera::util {

/*
  Time utilities. All emulator timestamps come from Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// "2024-05-01T12:30:00.000Z", the provider's timestamp format.
std::string FormatIso8601(TimePoint tp);

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace vera::util
