// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/report/frequency_tables.h"

#include <algorithm>
#include <map>
#include <set>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace ibmetrics::report {

using metrics::BuildRecord;
using metrics::Dataset;

namespace {

FrequencyTable CountAttribute(const Dataset& dataset, const metrics::AttributeSelector& attribute) {
  std::map<std::string, int64_t> counts;
  for (const BuildRecord& record : dataset) {
    counts[attribute(record)]++;
  }
  return RankCounts({counts.begin(), counts.end()});
}

void Truncate(size_t limit, FrequencyTable* table) {
  if (table->size() > limit) {
    table->resize(limit);
  }
}

}  // namespace

FrequencyTable RankCounts(const std::vector<std::pair<std::string, int64_t>>& counts) {
  FrequencyTable table;
  table.reserve(counts.size());
  for (const auto& [name, count] : counts) {
    table.push_back({name, count});
  }
  std::sort(table.begin(), table.end(), [](const RankedCount& a, const RankedCount& b) {
    if (a.count != b.count) {
      return a.count > b.count;
    }
    return a.name < b.name;
  });
  return table;
}

FrequencyTable TopPackages(const Dataset& dataset, size_t limit) {
  std::map<std::string, int64_t> counts;
  for (const BuildRecord& record : dataset) {
    std::set<std::string> packages(record.packages.begin(), record.packages.end());
    for (const auto& package : packages) {
      counts[package]++;
    }
  }
  FrequencyTable table = RankCounts({counts.begin(), counts.end()});
  Truncate(limit, &table);
  return table;
}

FrequencyTable ImageTypeCounts(const Dataset& dataset) {
  return CountAttribute(dataset, metrics::ImageType);
}

FrequencyTable FootprintCounts(const Dataset& footprint_dataset) {
  return CountAttribute(footprint_dataset, metrics::ImageType);
}

metrics::Status BiggestOrgs(const Dataset& dataset, const data::UserDirectory& users, size_t limit,
                            FrequencyTable* table) {
  FrequencyTable ranked = CountAttribute(dataset, metrics::AccountNumber);
  Truncate(limit, &ranked);
  for (auto& entry : ranked) {
    std::string name;
    auto status = users.NameForAccount(entry.name, &name);
    if (status != metrics::kOK) {
      return status;
    }
    entry.name = std::move(name);
  }
  *table = std::move(ranked);
  return metrics::kOK;
}

std::string FormatTable(const std::string& title, const FrequencyTable& table) {
  std::string text = absl::StrCat("## ", title, "\n");
  for (size_t i = 0; i < table.size(); i++) {
    absl::StrAppendFormat(&text, "%3d. %-40s %5d\n", i + 1, table[i].name, table[i].count);
  }
  absl::StrAppend(&text, "---------------------------------\n");
  return text;
}

}  // namespace ibmetrics::report
