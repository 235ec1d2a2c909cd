// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_WINDOW_AGGREGATOR_H_
#define IBMETRICS_SRC_METRICS_WINDOW_AGGREGATOR_H_

#include <vector>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"
#include "src/metrics/time_bucketer.h"

namespace ibmetrics::metrics {

// The window aggregators count, per time window, the distinct values of an attribute among the
// dated records whose created_at lies in the window. Undated records are ignored. A window with
// no records has a count of 0 and is still reported.
//
// Every aggregator returns kEmptyDataset if |dataset| has no dated record, and writes its output
// only on success.

// Computes one distinct-value count per bucket of |buckets|, in order. The series' timestamps are
// the bucket starts.
Status CountDistinctPerBucket(const Dataset& dataset, const std::vector<Bucket>& buckets,
                              const AttributeSelector& attribute, CountSeries* series);

// Computes the number of records (not distinct values) per bucket of |buckets|.
Status CountRecordsPerBucket(const Dataset& dataset, const std::vector<Bucket>& buckets,
                             CountSeries* series);

// Distinct values of |attribute| per calendar month over the time range of |dataset|. The series'
// timestamps are the first days of the months.
Status MonthlyDistinct(const Dataset& dataset, const AttributeSelector& attribute,
                       CountSeries* series);

// Distinct organizations per calendar month.
Status MonthlyUsers(const Dataset& dataset, CountSeries* series);

// Distinct builds (job ids) per calendar month.
Status MonthlyBuilds(const Dataset& dataset, CountSeries* series);

// Distinct values of |attribute| per fixed period between |start| and |end|. See
// FixedPeriodBuckets() for how the tail is handled. Returns kInvalidWindowSpec if |period| is not
// positive.
Status PeriodDistinct(const Dataset& dataset, Timestamp start, Timestamp end, Duration period,
                      const AttributeSelector& attribute, CountSeries* series);

// Number of records per fixed period, over the time range of |dataset|.
Status BuildsOverTime(const Dataset& dataset, Duration period, CountSeries* series);

// Number of records per fixed period between |start| and |end|.
Status BuildsOverTime(const Dataset& dataset, Timestamp start, Timestamp end, Duration period,
                      CountSeries* series);

// Distinct values of |attribute| in a sliding window of |window_days| days.
//
// With t0 and t1 the earliest and latest timestamps of |dataset|, the first window ends at
// t0 + |window_days| days and each following window ends one day later, for as long as the window
// end is strictly before t1. The window ending at e covers [e - |window_days| days, e). The
// series' timestamps are the window ends.
//
// Returns kInvalidWindowSpec if |window_days| is not positive.
Status SlidingWindowDistinct(const Dataset& dataset, const AttributeSelector& attribute,
                             int window_days, CountSeries* series);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_WINDOW_AGGREGATOR_H_
