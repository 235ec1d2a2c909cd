// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_REPORT_FREQUENCY_TABLES_H_
#define IBMETRICS_SRC_REPORT_FREQUENCY_TABLES_H_

#include <cstdint>
#include <string>
#include <vector>

#include "src/data/user_info.h"
#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::report {

struct RankedCount {
  std::string name;
  int64_t count = 0;
};

using FrequencyTable = std::vector<RankedCount>;

// Sorts |counts| by descending count, then by name.
FrequencyTable RankCounts(const std::vector<std::pair<std::string, int64_t>>& counts);

// The |limit| packages selected in the most builds. A package listed more than once in a build
// counts once for that build.
FrequencyTable TopPackages(const metrics::Dataset& dataset, size_t limit);

// The number of builds of every image type.
FrequencyTable ImageTypeCounts(const metrics::Dataset& dataset);

// The number of builds of every footprint.
FrequencyTable FootprintCounts(const metrics::Dataset& footprint_dataset);

// The |limit| accounts with the most builds. Accounts are named through |users|.
//
// Returns kAmbiguousLookup if the name of a listed account is ambiguous.
metrics::Status BiggestOrgs(const metrics::Dataset& dataset, const data::UserDirectory& users,
                            size_t limit, FrequencyTable* table);

// Renders |table| under |title|, one numbered line per entry.
std::string FormatTable(const std::string& title, const FrequencyTable& table);

}  // namespace ibmetrics::report

#endif  // IBMETRICS_SRC_REPORT_FREQUENCY_TABLES_H_
