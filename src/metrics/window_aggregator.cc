// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/window_aggregator.h"

#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "src/lib/util/datetime_util.h"
#include "src/logging.h"

namespace ibmetrics::metrics {

namespace {

using TimedRecord = std::pair<Timestamp, const BuildRecord*>;

// Returns the dated records of |dataset| ordered by created_at.
std::vector<TimedRecord> SortedByTime(const Dataset& dataset) {
  std::vector<TimedRecord> sorted;
  sorted.reserve(dataset.size());
  for (const auto& record : dataset) {
    if (record.created_at) {
      sorted.emplace_back(*record.created_at, &record);
    }
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TimedRecord& a, const TimedRecord& b) { return a.first < b.first; });
  return sorted;
}

std::vector<TimedRecord>::const_iterator FirstAtOrAfter(const std::vector<TimedRecord>& sorted,
                                                        Timestamp t) {
  return std::lower_bound(sorted.begin(), sorted.end(), t,
                          [](const TimedRecord& r, Timestamp value) { return r.first < value; });
}

}  // namespace

Status CountDistinctPerBucket(const Dataset& dataset, const std::vector<Bucket>& buckets,
                              const AttributeSelector& attribute, CountSeries* series) {
  std::vector<TimedRecord> sorted = SortedByTime(dataset);
  if (sorted.empty()) {
    LOG(ERROR) << "Cannot aggregate over a dataset with no dated record.";
    return kEmptyDataset;
  }

  CountSeries result;
  result.counts.reserve(buckets.size());
  result.timestamps.reserve(buckets.size());
  for (const auto& bucket : buckets) {
    std::unordered_set<std::string_view> values;
    for (auto it = FirstAtOrAfter(sorted, bucket.start);
         it != sorted.end() && it->first < bucket.end; ++it) {
      values.insert(attribute(*it->second));
    }
    result.counts.push_back(static_cast<int64_t>(values.size()));
    result.timestamps.push_back(bucket.start);
  }
  *series = std::move(result);
  return kOK;
}

Status CountRecordsPerBucket(const Dataset& dataset, const std::vector<Bucket>& buckets,
                             CountSeries* series) {
  std::vector<TimedRecord> sorted = SortedByTime(dataset);
  if (sorted.empty()) {
    LOG(ERROR) << "Cannot aggregate over a dataset with no dated record.";
    return kEmptyDataset;
  }

  CountSeries result;
  for (const auto& bucket : buckets) {
    auto first = FirstAtOrAfter(sorted, bucket.start);
    auto last = FirstAtOrAfter(sorted, bucket.end);
    result.counts.push_back(first < last ? static_cast<int64_t>(last - first) : 0);
    result.timestamps.push_back(bucket.start);
  }
  *series = std::move(result);
  return kOK;
}

Status MonthlyDistinct(const Dataset& dataset, const AttributeSelector& attribute,
                       CountSeries* series) {
  std::vector<Bucket> buckets;
  if (Status status = MonthlyBuckets(dataset, &buckets); status != kOK) {
    return status;
  }
  return CountDistinctPerBucket(dataset, buckets, attribute, series);
}

Status MonthlyUsers(const Dataset& dataset, CountSeries* series) {
  return MonthlyDistinct(dataset, OrgId, series);
}

Status MonthlyBuilds(const Dataset& dataset, CountSeries* series) {
  return MonthlyDistinct(dataset, JobId, series);
}

Status PeriodDistinct(const Dataset& dataset, Timestamp start, Timestamp end, Duration period,
                      const AttributeSelector& attribute, CountSeries* series) {
  std::vector<Bucket> buckets;
  if (Status status = FixedPeriodBuckets(start, end, period, &buckets); status != kOK) {
    return status;
  }
  return CountDistinctPerBucket(dataset, buckets, attribute, series);
}

Status BuildsOverTime(const Dataset& dataset, Duration period, CountSeries* series) {
  std::vector<Bucket> buckets;
  if (Status status = FixedPeriodBuckets(dataset, period, &buckets); status != kOK) {
    return status;
  }
  return CountRecordsPerBucket(dataset, buckets, series);
}

Status BuildsOverTime(const Dataset& dataset, Timestamp start, Timestamp end, Duration period,
                      CountSeries* series) {
  std::vector<Bucket> buckets;
  if (Status status = FixedPeriodBuckets(start, end, period, &buckets); status != kOK) {
    return status;
  }
  return CountRecordsPerBucket(dataset, buckets, series);
}

Status SlidingWindowDistinct(const Dataset& dataset, const AttributeSelector& attribute,
                             int window_days, CountSeries* series) {
  if (window_days <= 0) {
    LOG(ERROR) << "Sliding window width must be a positive number of days, got " << window_days;
    return kInvalidWindowSpec;
  }
  std::vector<TimedRecord> sorted = SortedByTime(dataset);
  if (sorted.empty()) {
    LOG(ERROR) << "Cannot aggregate over a dataset with no dated record.";
    return kEmptyDataset;
  }
  const Duration window = util::Days(window_days);
  const Duration step = util::Days(1);
  const Timestamp t_end = sorted.back().first;

  // Occurrences of each value currently inside the window. The window only moves forward, so
  // records enter at |next_in| and leave at |next_out|.
  std::unordered_map<std::string_view, int64_t> in_window;
  auto next_in = sorted.cbegin();
  auto next_out = sorted.cbegin();

  CountSeries result;
  for (Timestamp window_end = sorted.front().first + window; window_end < t_end;
       window_end += step) {
    for (; next_in != sorted.cend() && next_in->first < window_end; ++next_in) {
      ++in_window[attribute(*next_in->second)];
    }
    const Timestamp window_start = window_end - window;
    for (; next_out != next_in && next_out->first < window_start; ++next_out) {
      auto it = in_window.find(attribute(*next_out->second));
      if (--it->second == 0) {
        in_window.erase(it);
      }
    }
    result.counts.push_back(static_cast<int64_t>(in_window.size()));
    result.timestamps.push_back(window_end);
  }
  VLOG(4) << "Computed " << result.counts.size() << " windows of " << window_days << " days.";
  *series = std::move(result);
  return kOK;
}

}  // namespace ibmetrics::metrics
