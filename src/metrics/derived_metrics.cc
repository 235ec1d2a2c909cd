// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/derived_metrics.h"

#include <cmath>

#include "src/lib/util/datetime_util.h"
#include "src/logging.h"
#include "src/metrics/window_aggregator.h"

namespace ibmetrics::metrics {

Status DauOverMau(const Dataset& dataset, RatioSeries* ratios, int daily_window_days,
                  int monthly_window_days) {
  if (daily_window_days <= 0 || monthly_window_days <= 0 ||
      daily_window_days > monthly_window_days) {
    LOG(ERROR) << "Invalid DAU/MAU windows: " << daily_window_days << " and "
               << monthly_window_days << " days.";
    return kInvalidWindowSpec;
  }
  CountSeries dau;
  CountSeries mau;
  if (Status status = SlidingWindowDistinct(dataset, OrgId, daily_window_days, &dau);
      status != kOK) {
    return status;
  }
  if (Status status = SlidingWindowDistinct(dataset, OrgId, monthly_window_days, &mau);
      status != kOK) {
    return status;
  }
  if (mau.counts.size() > dau.counts.size()) {
    LOG(ERROR) << "Monthly series (" << mau.counts.size() << ") is longer than daily series ("
               << dau.counts.size() << ").";
    return kInternalError;
  }

  const size_t offset = dau.counts.size() - mau.counts.size();
  RatioSeries result;
  for (size_t i = 0; i < mau.counts.size(); i++) {
    if (dau.timestamps[offset + i] != mau.timestamps[i]) {
      LOG(ERROR) << "Daily and monthly windows are not aligned at "
                 << util::FormatTimestamp(mau.timestamps[i]);
      return kInternalError;
    }
    if (mau.counts[i] == 0) {
      LOG(ERROR) << "No active organization in the window ending "
                 << util::FormatTimestamp(mau.timestamps[i]) << "; DAU/MAU is undefined.";
      return kInvalidArguments;
    }
    result.values.push_back(static_cast<double>(dau.counts[offset + i]) /
                            static_cast<double>(mau.counts[i]));
    result.timestamps.push_back(mau.timestamps[i]);
  }
  *ratios = std::move(result);
  return kOK;
}

std::vector<double> CumulativeAverage(const std::vector<int64_t>& values) {
  std::vector<double> averages;
  averages.reserve(values.size());
  double sum = 0;
  for (size_t i = 0; i < values.size(); i++) {
    sum += static_cast<double>(values[i]);
    averages.push_back(sum / static_cast<double>(i + 1));
  }
  return averages;
}

std::vector<double> GaussianTrendline(const std::vector<double>& values, double std_dev) {
  const size_t n = values.size();
  if (n < 2) {
    return values;
  }
  const size_t half = n / 2;

  // Symmetric kernel of n points centred at (n - 1) / 2, normalized to sum to 1.
  std::vector<double> kernel(n);
  const double centre = static_cast<double>(n - 1) / 2.0;
  double kernel_sum = 0;
  for (size_t k = 0; k < n; k++) {
    double x = (static_cast<double>(k) - centre) / std_dev;
    kernel[k] = std::exp(-0.5 * x * x);
    kernel_sum += kernel[k];
  }
  for (auto& w : kernel) {
    w /= kernel_sum;
  }

  std::vector<double> padded(values);
  padded.insert(padded.end(), half, values.back());

  // Output i is element i + (n - 1) / 2 of the full convolution of |padded| with |kernel|, which
  // keeps the kernel centred on sample i.
  const size_t shift = (n - 1) / 2;
  std::vector<double> trend(n, 0.0);
  for (size_t i = 0; i < n; i++) {
    const size_t full_index = i + shift;
    double acc = 0;
    for (size_t k = 0; k < n; k++) {
      if (k > full_index || full_index - k >= padded.size()) {
        continue;
      }
      acc += padded[full_index - k] * kernel[k];
    }
    trend[i] = acc;
  }
  return trend;
}

}  // namespace ibmetrics::metrics
