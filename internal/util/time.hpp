#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace settleup::util {

/*
  Time utilities, single place to control clock source later.

  Expense timestamps cross the wire as google.protobuf.Timestamp, which
  maps to RFC 3339 strings in JSON.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

} // namespace settleup::util
