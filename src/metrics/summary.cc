// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/summary.h"

#include <string>
#include <unordered_set>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "src/lib/util/datetime_util.h"
#include "src/metrics/time_bucketer.h"

namespace ibmetrics::metrics {

Status MakeSummary(const Dataset& dataset, Summary* summary) {
  TimeRange range;
  if (Status status = GetTimeRange(dataset, &range); status != kOK) {
    return status;
  }
  Summary result;
  result.start = range.min;
  result.end = range.max;
  result.num_builds = static_cast<int64_t>(dataset.size());

  std::unordered_set<std::string> orgs;
  for (const auto& record : dataset) {
    orgs.insert(record.org_id);
    if (!record.packages.empty()) {
      result.num_builds_with_packages++;
    }
    if (!record.filesystem.empty()) {
      result.num_builds_with_fs_customizations++;
    }
    if (!record.payload_repositories.empty()) {
      result.num_builds_with_custom_repos++;
    }
  }
  result.num_users = static_cast<int64_t>(orgs.size());
  *summary = result;
  return kOK;
}

std::string Summarize(const Summary& summary) {
  std::vector<std::string> out = {
      "Summary",
      "=======\n",
      absl::StrCat("Period: ", util::FormatTimestamp(summary.start), " - ",
                   util::FormatTimestamp(summary.end), "\n"),
      absl::StrCat("- Total builds: ", summary.num_builds),
      absl::StrCat("- Number of users: ", summary.num_users),
      absl::StrCat("- Builds with packages: ", summary.num_builds_with_packages),
      absl::StrCat("- Builds with filesystem customizations: ",
                   summary.num_builds_with_fs_customizations),
      absl::StrCat("- Builds with custom repos: ", summary.num_builds_with_custom_repos),
  };
  return absl::StrJoin(out, "\n");
}

}  // namespace ibmetrics::metrics
