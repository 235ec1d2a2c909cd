// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_ACTIVITY_CLASSIFIER_H_
#define IBMETRICS_SRC_METRICS_ACTIVITY_CLASSIFIER_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::metrics {

// An organization is a repeat org if it built at least |min_builds| times within some rolling
// window shorter than |period|.
struct RepeatOrgPolicy {
  int min_builds = 2;
  Duration period = std::chrono::hours(24 * 7);
};

// An organization is active if it built on at least |min_days| distinct calendar days and its
// most recent build day is after |recent_limit_days| days before the reference time.
struct ActiveOrgPolicy {
  int min_days = 2;
  int recent_limit_days = 30;
};

// The smallest accepted RepeatOrgPolicy::min_builds. With a single build there are no gaps to sum,
// which would make every organization a repeat org.
constexpr int kMinRepeatBuilds = 2;

// Maps each organization to the ascending sequence of its build timestamps. Undated records are
// skipped.
using OrgTimelines = std::map<std::string, std::vector<Timestamp>>;

// Groups the dated records of |dataset| by organization.
//
// Returns kEmptyDataset if |dataset| has no dated record.
Status GetOrgTimelines(const Dataset& dataset, OrgTimelines* timelines);

// Returns true if some |min_builds| consecutive entries of |sorted_timestamps| span strictly less
// than |period|, i.e. some run of |min_builds| - 1 consecutive gaps sums to less than |period|.
// A timeline with fewer than |min_builds| entries never qualifies.
//
// |sorted_timestamps| must be in ascending order and |min_builds| at least kMinRepeatBuilds.
bool HasBuildBurst(const std::vector<Timestamp>& sorted_timestamps, int min_builds,
                   Duration period);

// Computes the set of repeat orgs of |dataset| under |policy|.
//
// Returns kInvalidWindowSpec if |policy.min_builds| is below kMinRepeatBuilds or |policy.period|
// is not positive, and kEmptyDataset if |dataset| has no dated record.
Status RepeatOrgs(const Dataset& dataset, const RepeatOrgPolicy& policy,
                  std::set<std::string>* repeat_orgs);

// Maps each organization to the ascending distinct days (midnight UTC) on which it built.
Status OrgBuildDays(const Dataset& dataset, OrgTimelines* build_days);

// Computes the set of active orgs of |dataset| under |policy|, relative to |now|.
//
// |now| is the caller's reference time; the classifier never reads the clock itself, so results
// are reproducible for a fixed |now|.
//
// Returns kInvalidWindowSpec if |policy.min_days| is below 1 or |policy.recent_limit_days| is
// negative, and kEmptyDataset if |dataset| has no dated record.
Status ActiveOrgs(const Dataset& dataset, const ActiveOrgPolicy& policy, Timestamp now,
                  std::set<std::string>* active_orgs);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_ACTIVITY_CLASSIFIER_H_
