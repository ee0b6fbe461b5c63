#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace sitely::util {

/*
  Time utilities: single place to control the clock source.

  Ledger dates are calendar dates ("YYYY-MM-DD") and timestamps are
  ISO-8601 UTC ("YYYY-MM-DDTHH:MM:SS.mmmZ"), both compared as text.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; components default to Now().
using TimeSource = std::function<TimePoint()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

std::string ToIsoDate(TimePoint tp);
std::string ToIsoTimestamp(TimePoint tp);
std::string ToClockTime(TimePoint tp);

// Calendar date `years` before `now` (UTC). Feb 29 maps to Feb 28 in
// non-leap target years.
std::string DateYearsBefore(TimePoint now, int years);

// True when value is exactly a valid "YYYY-MM-DD" calendar date.
bool IsIsoDate(const std::string& value);

} // namespace sitely::util
