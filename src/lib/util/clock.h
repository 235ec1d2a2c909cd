// Copyright 2017 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_LIB_UTIL_CLOCK_H_
#define IBMETRICS_SRC_LIB_UTIL_CLOCK_H_

#include <chrono>

namespace ibmetrics {
namespace util {

// The source of the default reference time of a report. Tests substitute a FakeSystemClock so that
// the active-org classification does not depend on the day the test runs.
class ClockInterface {
 public:
  virtual ~ClockInterface() = default;

  virtual std::chrono::system_clock::time_point now() = 0;
};

// A clock that returns the real system time.
class SystemClock : public ClockInterface {
 public:
  std::chrono::system_clock::time_point now() override { return std::chrono::system_clock::now(); }
};

// A clock stopped at a fixed time.
class FakeSystemClock : public ClockInterface {
 public:
  FakeSystemClock() = default;
  explicit FakeSystemClock(std::chrono::system_clock::time_point t) : time_(t) {}

  std::chrono::system_clock::time_point now() override { return time_; }

 private:
  std::chrono::system_clock::time_point time_ =
      std::chrono::system_clock::time_point(std::chrono::system_clock::duration(0));
};

}  // namespace util
}  // namespace ibmetrics

#endif  // IBMETRICS_SRC_LIB_UTIL_CLOCK_H_
