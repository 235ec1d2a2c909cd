// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/cohort_tracker.h"

#include <set>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "src/lib/util/datetime_util.h"
#include "src/logging.h"
#include "src/metrics/time_bucketer.h"
#include "src/metrics/window_aggregator.h"

namespace ibmetrics::metrics {

Status FirstSeenPerOrg(const Dataset& dataset, std::vector<FirstSeen>* first_seen) {
  std::vector<FirstSeen> result;
  std::unordered_map<std::string, size_t> index;
  for (const auto& record : dataset) {
    if (!record.created_at) {
      continue;
    }
    auto [it, inserted] = index.emplace(record.org_id, result.size());
    if (inserted) {
      result.push_back({record.org_id, *record.created_at});
    } else if (*record.created_at < result[it->second].first_seen) {
      result[it->second].first_seen = *record.created_at;
    }
  }
  if (result.empty()) {
    LOG(ERROR) << "Cannot track cohorts of a dataset with no dated record.";
    return kEmptyDataset;
  }
  VLOG(4) << "Found " << result.size() << " organizations.";
  *first_seen = std::move(result);
  return kOK;
}

Status FirstSeenDataset(const Dataset& dataset, Dataset* reduced) {
  std::vector<FirstSeen> first_seen;
  if (Status status = FirstSeenPerOrg(dataset, &first_seen); status != kOK) {
    return status;
  }
  Dataset result;
  result.reserve(first_seen.size());
  for (auto& org : first_seen) {
    BuildRecord record;
    record.org_id = std::move(org.org_id);
    record.created_at = org.first_seen;
    result.push_back(std::move(record));
  }
  *reduced = std::move(result);
  return kOK;
}

Status MonthlyNewUsers(const Dataset& dataset, CountSeries* series) {
  Dataset first_builds;
  if (Status status = FirstSeenDataset(dataset, &first_builds); status != kOK) {
    return status;
  }
  return MonthlyUsers(first_builds, series);
}

Status MonthlyUsersStacked(const Dataset& dataset, UserSplitSeries* series) {
  std::vector<Bucket> months;
  if (Status status = MonthlyBuckets(dataset, &months); status != kOK) {
    return status;
  }
  Dataset first_builds;
  if (Status status = FirstSeenDataset(dataset, &first_builds); status != kOK) {
    return status;
  }
  CountSeries all;
  CountSeries fresh;
  if (Status status = CountDistinctPerBucket(dataset, months, OrgId, &all); status != kOK) {
    return status;
  }
  if (Status status = CountDistinctPerBucket(first_builds, months, OrgId, &fresh);
      status != kOK) {
    return status;
  }

  UserSplitSeries result;
  result.bucket_starts = BucketStarts(months);
  for (size_t i = 0; i < months.size(); i++) {
    int64_t returning = all.counts[i] - fresh.counts[i];
    if (returning < 0) {
      LOG(ERROR) << "Month starting " << util::FormatDate(months[i].start) << " has "
                 << fresh.counts[i] << " new organizations but only " << all.counts[i]
                 << " organizations.";
      return kInternalError;
    }
    result.total.push_back(all.counts[i]);
    result.new_users.push_back(fresh.counts[i]);
    result.returning.push_back(returning);
  }
  *series = std::move(result);
  return kOK;
}

Status PeriodicUsers(const Dataset& dataset, Timestamp start, Duration period,
                     UserSplitSeries* series) {
  if (period <= Duration::zero()) {
    LOG(ERROR) << "User period must be positive, got " << period.count() << " ticks.";
    return kInvalidWindowSpec;
  }
  TimeRange range;
  if (Status status = GetTimeRange(dataset, &range); status != kOK) {
    return status;
  }

  std::vector<Bucket> periods;
  for (Timestamp p_start = start; p_start < range.max; p_start += period) {
    periods.push_back({p_start, p_start + period});
  }

  UserSplitSeries result;
  result.bucket_starts = BucketStarts(periods);
  result.total.assign(periods.size(), 0);
  result.new_users.assign(periods.size(), 0);
  result.returning.assign(periods.size(), 0);

  std::vector<std::set<std::string_view>> period_users(periods.size());
  for (const auto& record : dataset) {
    if (!record.created_at || *record.created_at < start) {
      continue;
    }
    auto offset = (*record.created_at - start) / period;
    if (offset < 0 || static_cast<size_t>(offset) >= periods.size()) {
      continue;
    }
    period_users[offset].insert(record.org_id);
  }

  std::unordered_set<std::string_view> users_so_far;
  for (size_t i = 0; i < periods.size(); i++) {
    int64_t new_users = 0;
    for (std::string_view org : period_users[i]) {
      if (users_so_far.insert(org).second) {
        new_users++;
      }
    }
    result.total[i] = static_cast<int64_t>(period_users[i].size());
    result.new_users[i] = new_users;
    result.returning[i] = result.total[i] - new_users;
  }
  *series = std::move(result);
  return kOK;
}

}  // namespace ibmetrics::metrics
