// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_SUMMARY_H_
#define IBMETRICS_SRC_METRICS_SUMMARY_H_

#include <string>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::metrics {

struct Summary {
  Timestamp start;
  Timestamp end;
  int64_t num_builds = 0;
  int64_t num_users = 0;
  int64_t num_builds_with_packages = 0;
  int64_t num_builds_with_fs_customizations = 0;
  int64_t num_builds_with_custom_repos = 0;
};

// Summarizes |dataset|. |start| and |end| are the earliest and latest dated builds; the counts
// include every record.
//
// Returns kEmptyDataset if |dataset| has no dated record.
Status MakeSummary(const Dataset& dataset, Summary* summary);

// Renders |summary| as a human-readable text block.
std::string Summarize(const Summary& summary);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_SUMMARY_H_
