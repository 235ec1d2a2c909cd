// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_DERIVED_METRICS_H_
#define IBMETRICS_SRC_METRICS_DERIVED_METRICS_H_

#include <vector>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::metrics {

constexpr int kDailyWindowDays = 1;
constexpr int kMonthlyWindowDays = 30;

// The default standard deviation, in samples, of the GaussianTrendline() kernel.
constexpr double kTrendlineStdDev = 7.0;

// Computes the ratio of daily active organizations (a sliding window of |daily_window_days|) over
// monthly active organizations (a sliding window of |monthly_window_days|) for each window end at
// which both are defined.
//
// The monthly series starts later than the daily one, so only the tail of the daily series that
// lines up with the monthly window ends is used. If the dataset is too short for a single monthly
// window the result is empty.
//
// Returns kInvalidWindowSpec if either width is not positive or |daily_window_days| exceeds
// |monthly_window_days|, kEmptyDataset if |dataset| has no dated record, and kInvalidArguments if
// some monthly window has no organization.
Status DauOverMau(const Dataset& dataset, RatioSeries* ratios,
                  int daily_window_days = kDailyWindowDays,
                  int monthly_window_days = kMonthlyWindowDays);

// Returns the expanding mean of |values|: element i is the mean of values[0..i]. This is a running
// average over everything seen so far, not a fixed-width moving average.
std::vector<double> CumulativeAverage(const std::vector<int64_t>& values);

// Smooths |values| for long-range trend display by convolving with a normalized Gaussian kernel as
// long as the series, centred on each sample. The series is padded past its end with copies of its
// last value so that the trend does not droop at the tail.
//
// Series of fewer than two values are returned unchanged.
std::vector<double> GaussianTrendline(const std::vector<double>& values,
                                      double std_dev = kTrendlineStdDev);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_DERIVED_METRICS_H_
