#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"

namespace archiver::util {

/*
  Time utilities — single place to control clock source.

  Components that make time based decisions take a NowFn so tests can pin
  the wall clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);

// Minute of the hour in local time, 0..59.
int MinuteOfHour(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration);

} // namespace archiver::util
