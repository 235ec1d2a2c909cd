// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/lib/util/datetime_util.h"

#include "absl/strings/ascii.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"

namespace ibmetrics::util {

namespace {

constexpr const char* kTimestampFormats[] = {
    "%Y-%m-%d %H:%M:%E*S%Ez", "%Y-%m-%d %H:%M:%E*S", "%Y-%m-%dT%H:%M:%E*S%Ez",
    "%Y-%m-%dT%H:%M:%E*S",    "%Y-%m-%d",
};

}  // namespace

int64_t TimeToDayIndex(std::chrono::system_clock::time_point time) {
  absl::CivilDay day = absl::ToCivilDay(absl::FromChrono(time), absl::UTCTimeZone());
  return day - absl::CivilDay(1970, 1, 1);
}

std::chrono::system_clock::time_point StartOfDay(std::chrono::system_clock::time_point time) {
  absl::TimeZone utc = absl::UTCTimeZone();
  return absl::ToChronoTime(absl::FromCivil(absl::ToCivilDay(absl::FromChrono(time), utc), utc));
}

std::chrono::system_clock::time_point StartOfWeek(std::chrono::system_clock::time_point time) {
  absl::TimeZone utc = absl::UTCTimeZone();
  absl::CivilDay day = absl::ToCivilDay(absl::FromChrono(time), utc);
  absl::CivilDay monday = absl::PrevWeekday(day + 1, absl::Weekday::monday);
  return absl::ToChronoTime(absl::FromCivil(monday, utc));
}

std::chrono::system_clock::time_point StartOfMonth(std::chrono::system_clock::time_point time) {
  return AddMonths(time, 0);
}

std::chrono::system_clock::time_point AddMonths(std::chrono::system_clock::time_point time,
                                                int num_months) {
  absl::TimeZone utc = absl::UTCTimeZone();
  absl::CivilMonth month = absl::ToCivilMonth(absl::FromChrono(time), utc) + num_months;
  return absl::ToChronoTime(absl::FromCivil(month, utc));
}

std::chrono::system_clock::time_point FromCalendarDate(int64_t year, int month, int day, int hour,
                                                       int minute, int second) {
  absl::CivilSecond civil(year, month, day, hour, minute, second);
  return absl::ToChronoTime(absl::FromCivil(civil, absl::UTCTimeZone()));
}

bool ParseTimestamp(const std::string& text, std::chrono::system_clock::time_point* time) {
  std::string stripped(absl::StripAsciiWhitespace(text));
  if (stripped.empty()) {
    return false;
  }
  for (const char* format : kTimestampFormats) {
    absl::Time parsed;
    std::string err;
    if (absl::ParseTime(format, stripped, absl::UTCTimeZone(), &parsed, &err)) {
      *time = absl::ToChronoTime(parsed);
      return true;
    }
  }
  return false;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
  return absl::FormatTime("%Y-%m-%d %H:%M:%E*S", absl::FromChrono(time), absl::UTCTimeZone());
}

std::string FormatDate(std::chrono::system_clock::time_point time) {
  return absl::FormatTime("%Y-%m-%d", absl::FromChrono(time), absl::UTCTimeZone());
}

}  // namespace ibmetrics::util
