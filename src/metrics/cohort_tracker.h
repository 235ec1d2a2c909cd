// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_COHORT_TRACKER_H_
#define IBMETRICS_SRC_METRICS_COHORT_TRACKER_H_

#include <string>
#include <vector>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::metrics {

// The earliest build of an organization.
struct FirstSeen {
  std::string org_id;
  Timestamp first_seen;
};

// Per-bucket user counts split into users seen for the first time in the bucket and users that
// were already seen before it. |total[i] == new_users[i] + returning[i]| for every bucket.
struct UserSplitSeries {
  std::vector<Timestamp> bucket_starts;
  std::vector<int64_t> total;
  std::vector<int64_t> new_users;
  std::vector<int64_t> returning;
};

// Computes the earliest created_at of every organization of |dataset|. Each organization with at
// least one dated record appears exactly once, in order of first appearance in |dataset|.
//
// Returns kEmptyDataset if |dataset| has no dated record.
Status FirstSeenPerOrg(const Dataset& dataset, std::vector<FirstSeen>* first_seen);

// Reduces |dataset| to one record per organization whose created_at is the org's first build.
// Only org_id and created_at are set on the reduced records. The result can be passed to any
// aggregator of window_aggregator.h.
Status FirstSeenDataset(const Dataset& dataset, Dataset* reduced);

// Number of organizations whose first build falls in each calendar month, over the months spanned
// by the first builds.
Status MonthlyNewUsers(const Dataset& dataset, CountSeries* series);

// Distinct organizations per calendar month of |dataset|, split into new and returning
// organizations. New organizations are counted over the same months as the totals, so the three
// series are aligned.
//
// Returns kInternalError if a month has more new organizations than organizations.
Status MonthlyUsersStacked(const Dataset& dataset, UserSplitSeries* series);

// Walks periods [s, s + |period|) starting at |start| while s is before the latest timestamp of
// |dataset|. Unlike FixedPeriodBuckets() the last period may extend past the latest build. A
// build exactly at the end of the last period is outside of the walk. An organization is new in
// the first period of the walk in which it builds; builds before |start| are not considered.
//
// Returns kInvalidWindowSpec if |period| is not positive.
Status PeriodicUsers(const Dataset& dataset, Timestamp start, Duration period,
                     UserSplitSeries* series);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_COHORT_TRACKER_H_
