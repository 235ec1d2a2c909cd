// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_LIB_UTIL_DATETIME_UTIL_H_
#define IBMETRICS_SRC_LIB_UTIL_DATETIME_UTIL_H_

#include <chrono>
#include <cstdint>
#include <string>

namespace ibmetrics::util {

// All calendar computations in this file are done in UTC. Timestamps in a dataset carry no
// timezone; treating them as UTC keeps day and month boundaries consistent across the dataset.

constexpr std::chrono::hours kOneDay(24);

// Returns a duration of |num_days| 24-hour days.
inline std::chrono::system_clock::duration Days(int64_t num_days) {
  return std::chrono::duration_cast<std::chrono::system_clock::duration>(kOneDay * num_days);
}

// Returns the number of days since the Unix epoch of the day containing |time|.
int64_t TimeToDayIndex(std::chrono::system_clock::time_point time);

// Returns midnight at the start of the day containing |time|.
std::chrono::system_clock::time_point StartOfDay(std::chrono::system_clock::time_point time);

// Returns midnight at the start of the Monday on or before |time|.
std::chrono::system_clock::time_point StartOfWeek(std::chrono::system_clock::time_point time);

// Returns midnight on the first day of the month containing |time|.
std::chrono::system_clock::time_point StartOfMonth(std::chrono::system_clock::time_point time);

// Returns the first day of the month |num_months| calendar months after the month containing
// |time|. |num_months| may be negative.
std::chrono::system_clock::time_point AddMonths(std::chrono::system_clock::time_point time,
                                                int num_months);

// Returns the midnight timestamp of the given calendar date. Out-of-range fields are normalized
// (e.g. day 32 of January is February 1).
std::chrono::system_clock::time_point FromCalendarDate(int64_t year, int month, int day,
                                                       int hour = 0, int minute = 0,
                                                       int second = 0);

// Parses |text| as one of
//   YYYY-MM-DD
//   YYYY-MM-DD HH:MM:SS[.ffffff][+hh:mm]
//   YYYY-MM-DDTHH:MM:SS[.ffffff][+hh:mm]
// Surrounding whitespace is ignored. Returns false and leaves |time| untouched if |text| matches
// none of the formats.
bool ParseTimestamp(const std::string& text, std::chrono::system_clock::time_point* time);

// Formats |time| as "YYYY-MM-DD HH:MM:SS", with fractional seconds only if present.
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

// Formats |time| as "YYYY-MM-DD".
std::string FormatDate(std::chrono::system_clock::time_point time);

}  // namespace ibmetrics::util

#endif  // IBMETRICS_SRC_LIB_UTIL_DATETIME_UTIL_H_
