// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_TIME_BUCKETER_H_
#define IBMETRICS_SRC_METRICS_TIME_BUCKETER_H_

#include <vector>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::metrics {

// The half-open interval [start, end).
struct Bucket {
  Timestamp start;
  Timestamp end;

  [[nodiscard]] bool Contains(Timestamp t) const { return start <= t && t < end; }
};

// The earliest and latest created_at of the dated records of a dataset.
struct TimeRange {
  Timestamp min;
  Timestamp max;
};

// Computes the TimeRange of |dataset|, ignoring undated records.
//
// Returns kEmptyDataset if |dataset| contains no dated record.
Status GetTimeRange(const Dataset& dataset, TimeRange* range);

// Partitions the months spanned by |range| into calendar-month buckets.
//
// The first bucket starts on the first day of the month containing |range.min|; the last bucket
// ends on the first day of the month after the one containing |range.max|. Every bucket is exactly
// one calendar month wide.
std::vector<Bucket> MonthlyBuckets(const TimeRange& range);

// As above, over the time range of |dataset|. Returns kEmptyDataset if |dataset| has no dated
// record.
Status MonthlyBuckets(const Dataset& dataset, std::vector<Bucket>* buckets);

// Produces the fixed-period buckets [start, start+P), [start+P, start+2P), ...
//
// A bucket is emitted only while its end lies strictly before |end|. A trailing period that
// straddles |end| or ends exactly at it is dropped; callers that need the tail covered must pass
// an |end| beyond the last timestamp of interest.
//
// Returns kInvalidWindowSpec if |period| is not positive.
Status FixedPeriodBuckets(Timestamp start, Timestamp end, Duration period,
                          std::vector<Bucket>* buckets);

// As above, with |start| and |end| taken from the time range of |dataset|.
Status FixedPeriodBuckets(const Dataset& dataset, Duration period, std::vector<Bucket>* buckets);

// Returns the start of every bucket in |buckets|.
std::vector<Timestamp> BucketStarts(const std::vector<Bucket>& buckets);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_TIME_BUCKETER_H_
