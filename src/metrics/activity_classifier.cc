// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/activity_classifier.h"

#include <algorithm>

#include "src/lib/util/datetime_util.h"
#include "src/logging.h"

namespace ibmetrics::metrics {

Status GetOrgTimelines(const Dataset& dataset, OrgTimelines* timelines) {
  OrgTimelines result;
  for (const auto& record : dataset) {
    if (record.created_at) {
      result[record.org_id].push_back(*record.created_at);
    }
  }
  if (result.empty()) {
    LOG(ERROR) << "Cannot classify organizations of a dataset with no dated record.";
    return kEmptyDataset;
  }
  for (auto& [org_id, timeline] : result) {
    std::sort(timeline.begin(), timeline.end());
  }
  *timelines = std::move(result);
  return kOK;
}

bool HasBuildBurst(const std::vector<Timestamp>& sorted_timestamps, int min_builds,
                   Duration period) {
  CHECK_GE(min_builds, kMinRepeatBuilds);
  const size_t run = static_cast<size_t>(min_builds) - 1;
  if (sorted_timestamps.size() < static_cast<size_t>(min_builds)) {
    return false;
  }
  // The gaps from entry i to entry i + run sum to the span between the two entries.
  for (size_t i = 0; i + run < sorted_timestamps.size(); i++) {
    if (sorted_timestamps[i + run] - sorted_timestamps[i] < period) {
      return true;
    }
  }
  return false;
}

Status RepeatOrgs(const Dataset& dataset, const RepeatOrgPolicy& policy,
                  std::set<std::string>* repeat_orgs) {
  if (policy.min_builds < kMinRepeatBuilds) {
    LOG(ERROR) << "min_builds must be at least " << kMinRepeatBuilds << ", got "
               << policy.min_builds;
    return kInvalidWindowSpec;
  }
  if (policy.period <= Duration::zero()) {
    LOG(ERROR) << "Repeat org period must be positive.";
    return kInvalidWindowSpec;
  }
  OrgTimelines timelines;
  if (Status status = GetOrgTimelines(dataset, &timelines); status != kOK) {
    return status;
  }

  std::set<std::string> result;
  for (const auto& [org_id, timeline] : timelines) {
    if (HasBuildBurst(timeline, policy.min_builds, policy.period)) {
      result.insert(org_id);
    }
  }
  VLOG(3) << result.size() << " of " << timelines.size() << " organizations are repeat orgs.";
  *repeat_orgs = std::move(result);
  return kOK;
}

Status OrgBuildDays(const Dataset& dataset, OrgTimelines* build_days) {
  OrgTimelines timelines;
  if (Status status = GetOrgTimelines(dataset, &timelines); status != kOK) {
    return status;
  }
  for (auto& [org_id, timeline] : timelines) {
    for (auto& t : timeline) {
      t = util::StartOfDay(t);
    }
    timeline.erase(std::unique(timeline.begin(), timeline.end()), timeline.end());
  }
  *build_days = std::move(timelines);
  return kOK;
}

Status ActiveOrgs(const Dataset& dataset, const ActiveOrgPolicy& policy, Timestamp now,
                  std::set<std::string>* active_orgs) {
  if (policy.min_days < 1) {
    LOG(ERROR) << "min_days must be at least 1, got " << policy.min_days;
    return kInvalidWindowSpec;
  }
  if (policy.recent_limit_days < 0) {
    LOG(ERROR) << "recent_limit_days must not be negative, got " << policy.recent_limit_days;
    return kInvalidWindowSpec;
  }
  OrgTimelines build_days;
  if (Status status = OrgBuildDays(dataset, &build_days); status != kOK) {
    return status;
  }

  const Timestamp cutoff = now - util::Days(policy.recent_limit_days);
  std::set<std::string> result;
  for (const auto& [org_id, days] : build_days) {
    if (days.size() < static_cast<size_t>(policy.min_days)) {
      continue;
    }
    // The most recent day is compared at day granularity against an exact cutoff time.
    if (days.back() > cutoff) {
      result.insert(org_id);
    }
  }
  VLOG(3) << result.size() << " of " << build_days.size() << " organizations are active as of "
          << util::FormatTimestamp(now);
  *active_orgs = std::move(result);
  return kOK;
}

}  // namespace ibmetrics::metrics
