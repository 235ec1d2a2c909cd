// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_DATA_FILTERS_H_
#define IBMETRICS_SRC_DATA_FILTERS_H_

#include <set>
#include <string>
#include <vector>

#include "src/data/user_info.h"
#include "src/lib/util/status.h"
#include "src/metrics/build_record.h"

namespace ibmetrics::data {

// The name matched against filter patterns for users without a name.
constexpr char kMissingUserName[] = "---";

// Collects the org ids of the users whose name matches any of |patterns|. A pattern is
// a case-insensitive regular expression anchored at the start of the name. Empty patterns are
// skipped.
//
// Returns INVALID_ARGUMENT if a pattern is not a valid regular expression.
util::Status GetFilterIds(const std::vector<UserInfo>& users,
                          const std::vector<std::string>& patterns, std::set<std::string>* ids);

// Returns the records of |dataset| whose org_id is not in |org_ids|.
metrics::Dataset FilterOrgs(const metrics::Dataset& dataset, const std::set<std::string>& org_ids);

// Removes the builds of the users whose name matches any of |patterns|. Records are matched by
// account_number.
util::Status FilterUsers(const metrics::Dataset& dataset, const std::vector<UserInfo>& users,
                         const std::vector<std::string>& patterns, metrics::Dataset* filtered);

// Returns the dated records of |dataset| with start <= created_at <= end.
metrics::Dataset SliceTime(const metrics::Dataset& dataset, metrics::Timestamp start,
                           metrics::Timestamp end);

// Reads one pattern per line from the file at |path|. Blank lines and lines starting with '#'
// are skipped.
util::Status ReadUserFilter(const std::string& path, std::vector<std::string>* patterns);

}  // namespace ibmetrics::data

#endif  // IBMETRICS_SRC_DATA_FILTERS_H_
