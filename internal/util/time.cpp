#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <initializer_list>

namespace sitely::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           out{};
  gmtime_r(&t, &out);
  return out;
}

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

std::string FormatDate(int year, int month, int day) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIsoDate(TimePoint tp) {
  const auto utc = ToUtc(tp);
  return FormatDate(utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
}

std::string ToIsoTimestamp(TimePoint tp) {
  const auto utc    = ToUtc(tp);
  const auto millis = ToUnixMillis(tp) % 1000;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buf;
}

std::string ToClockTime(TimePoint tp) {
  const auto utc = ToUtc(tp);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", utc.tm_hour, utc.tm_min, utc.tm_sec);
  return buf;
}

std::string DateYearsBefore(TimePoint now, int years) {
  const auto utc   = ToUtc(now);
  const int  year  = utc.tm_year + 1900 - years;
  const int  month = utc.tm_mon + 1;
  int        day   = utc.tm_mday;

  if (day > DaysInMonth(year, month)) {
    day = DaysInMonth(year, month);
  }
  return FormatDate(year, month, day);
}

bool IsIsoDate(const std::string& value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return false;
  }
  for (int i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }

  const int year  = std::stoi(value.substr(0, 4));
  const int month = std::stoi(value.substr(5, 2));
  const int day   = std::stoi(value.substr(8, 2));
  if (month < 1 || month > 12) {
    return false;
  }
  return day >= 1 && day <= DaysInMonth(year, month);
}

} // namespace sitely::util
