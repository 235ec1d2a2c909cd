// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/time_bucketer.h"

#include "src/lib/util/datetime_util.h"
#include "src/logging.h"

namespace ibmetrics::metrics {

Status GetTimeRange(const Dataset& dataset, TimeRange* range) {
  bool found = false;
  for (const auto& record : dataset) {
    if (!record.created_at) {
      continue;
    }
    const Timestamp& t = *record.created_at;
    if (!found) {
      range->min = t;
      range->max = t;
      found = true;
      continue;
    }
    if (t < range->min) {
      range->min = t;
    }
    if (t > range->max) {
      range->max = t;
    }
  }
  if (!found) {
    LOG(ERROR) << "Dataset of " << dataset.size() << " records has no dated record.";
    return kEmptyDataset;
  }
  return kOK;
}

std::vector<Bucket> MonthlyBuckets(const TimeRange& range) {
  std::vector<Bucket> buckets;
  Timestamp month_end = util::AddMonths(range.max, 1);
  for (Timestamp month = util::StartOfMonth(range.min); month < month_end;) {
    Timestamp next = util::AddMonths(month, 1);
    buckets.push_back({month, next});
    month = next;
  }
  return buckets;
}

Status MonthlyBuckets(const Dataset& dataset, std::vector<Bucket>* buckets) {
  TimeRange range;
  if (Status status = GetTimeRange(dataset, &range); status != kOK) {
    return status;
  }
  *buckets = MonthlyBuckets(range);
  return kOK;
}

Status FixedPeriodBuckets(Timestamp start, Timestamp end, Duration period,
                          std::vector<Bucket>* buckets) {
  if (period <= Duration::zero()) {
    LOG(ERROR) << "Bucket period must be positive, got " << period.count() << " ticks.";
    return kInvalidWindowSpec;
  }
  buckets->clear();
  for (Timestamp bucket_start = start; bucket_start + period < end; bucket_start += period) {
    buckets->push_back({bucket_start, bucket_start + period});
  }
  VLOG(5) << "Produced " << buckets->size() << " buckets between " << util::FormatTimestamp(start)
          << " and " << util::FormatTimestamp(end);
  return kOK;
}

Status FixedPeriodBuckets(const Dataset& dataset, Duration period, std::vector<Bucket>* buckets) {
  if (period <= Duration::zero()) {
    LOG(ERROR) << "Bucket period must be positive, got " << period.count() << " ticks.";
    return kInvalidWindowSpec;
  }
  TimeRange range;
  if (Status status = GetTimeRange(dataset, &range); status != kOK) {
    return status;
  }
  return FixedPeriodBuckets(range.min, range.max, period, buckets);
}

std::vector<Timestamp> BucketStarts(const std::vector<Bucket>& buckets) {
  std::vector<Timestamp> starts;
  starts.reserve(buckets.size());
  for (const auto& bucket : buckets) {
    starts.push_back(bucket.start);
  }
  return starts;
}

}  // namespace ibmetrics::metrics
